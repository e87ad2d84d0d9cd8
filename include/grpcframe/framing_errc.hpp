//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_FRAMING_ERRC_HPP
#define GRPCFRAME_FRAMING_ERRC_HPP

#include <boost/system/error_code.hpp>

namespace grpcframe {

const boost::system::error_category& get_framing_category();

enum class framing_errc : int
{
    /// The destination or source buffer is shorter than the length field.
    /// This is a programming error.
    buffer_too_small = 1,

    /// The declared message length exceeds the maximum allowed size.
    message_too_large,

    /// The compression flag in a frame header has a value other than 0 or 1.
    corrupt_frame,

    /// A compressed frame was received. No compression codec is implemented.
    unsupported_compression,

    /// The stream ended before a complete message was received, or extra bytes
    /// followed a message read in single-message mode.
    incomplete_message,

    /// The read operation was cancelled before a message was received.
    read_cancelled,
};

/// Creates an \ref error_code from a \ref framing_errc.
inline boost::system::error_code make_error_code(framing_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_framing_category());
}

}  // namespace grpcframe

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::grpcframe::framing_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
