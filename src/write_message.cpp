//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <array>
#include <span>
#include <vector>

#include "grpcframe/protocol/header.hpp"
#include "grpcframe/protocol/write_message.hpp"

boost::system::error_code grpcframe::protocol::serialize_frame(
    std::span<const unsigned char> payload,
    std::vector<unsigned char>& to
)
{
    std::array<unsigned char, header_size> header{};
    if (auto ec = serialize_header(payload.size(), header))
        return ec;

    to.reserve(to.size() + header_size + payload.size());
    to.insert(to.end(), header.begin(), header.end());
    to.insert(to.end(), payload.begin(), payload.end());
    return boost::system::error_code();
}
