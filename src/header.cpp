//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

#include "grpcframe/framing_errc.hpp"
#include "grpcframe/protocol/header.hpp"

using namespace grpcframe::protocol;
using boost::system::error_code;
using grpcframe::framing_errc;

error_code grpcframe::protocol::encode_length(std::uint32_t length, std::span<unsigned char> to)
{
    if (to.size() < length_field_size)
        return framing_errc::buffer_too_small;
    boost::endian::store_big_u32(to.data(), length);
    return error_code();
}

error_code grpcframe::protocol::decode_length(std::span<const unsigned char> from, std::uint32_t& to)
{
    if (from.size() < length_field_size)
        return framing_errc::buffer_too_small;

    // The field is unsigned, but lengths above INT32_MAX are not allowed
    auto res = boost::endian::load_big_u32(from.data());
    if (res > max_message_size)
        return framing_errc::message_too_large;

    to = res;
    return error_code();
}

error_code grpcframe::protocol::decode_compression_flag(unsigned char flag, bool& compressed)
{
    switch (flag)
    {
        case 0: compressed = false; return error_code();
        case 1: compressed = true; return error_code();
        default: return framing_errc::corrupt_frame;
    }
}

error_code grpcframe::protocol::parse_header(std::span<const unsigned char, header_size> from, frame_header& to)
{
    // Deserialize individual fields
    bool compressed{};
    if (auto ec = decode_compression_flag(from[0], compressed))
        return ec;

    std::uint32_t size{};
    if (auto ec = decode_length(from.subspan<1>(), size))
        return ec;

    // Done
    to = frame_header{compressed, size};
    return error_code();
}

error_code grpcframe::protocol::serialize_header(std::size_t size, std::span<unsigned char, header_size> to)
{
    // Range check the length
    if (size > max_message_size)
        return framing_errc::message_too_large;

    // We never compress
    to[0] = 0;

    // Length
    return encode_length(static_cast<std::uint32_t>(size), to.subspan<1>());
}
