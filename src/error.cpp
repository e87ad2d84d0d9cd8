//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <string>

#include "grpcframe/framing_errc.hpp"

using namespace grpcframe;

namespace {

static const char* error_to_string(framing_errc error)
{
    switch (error)
    {
        case framing_errc::buffer_too_small: return "Buffer too small to encode or decode the message length";
        case framing_errc::message_too_large: return "Message too large";
        case framing_errc::corrupt_frame: return "Unexpected compressed flag value in message header";
        case framing_errc::unsupported_compression: return "Compressed messages are not yet supported";
        case framing_errc::incomplete_message: return "Incomplete message";
        case framing_errc::read_cancelled: return "Incoming message cancelled";
        default: return "<unknown grpcframe framing error>";
    }
}

class framing_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "grpcframe.framing"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<framing_errc>(ev)); }
};

static framing_category g_framecat;

}  // namespace

const boost::system::error_category& grpcframe::get_framing_category() { return g_framecat; }
