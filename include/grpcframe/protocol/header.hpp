//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_HEADER_HPP
#define GRPCFRAME_PROTOCOL_HEADER_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace grpcframe {
namespace protocol {

// Size of the Message-Length field
inline constexpr std::size_t length_field_size = 4u;

// Compressed-Flag + Message-Length
inline constexpr std::size_t header_size = length_field_size + 1u;

// Lengths must fit in an int32, even if the field is unsigned
inline constexpr std::size_t max_message_size = static_cast<std::size_t>(
    (std::numeric_limits<std::int32_t>::max)()
);

// Frame header operations
struct frame_header
{
    bool compressed;   // The Compressed-Flag
    std::size_t size;  // Payload size, excluding the header. Should be <= INT32_MAX
};

// Writes length as 4 big-endian bytes at the beginning of to.
// Fails with buffer_too_small if to has less than 4 bytes
boost::system::error_code encode_length(std::uint32_t length, std::span<unsigned char> to);

// Reads 4 big-endian bytes. Fails with buffer_too_small if from is too short
// and with message_too_large if the value doesn't fit in an int32
boost::system::error_code decode_length(std::span<const unsigned char> from, std::uint32_t& to);

// 0 => uncompressed, 1 => compressed, anything else => corrupt_frame
boost::system::error_code decode_compression_flag(unsigned char flag, bool& compressed);

boost::system::error_code parse_header(std::span<const unsigned char, header_size> from, frame_header& to);

// Always writes an uncompressed header. Might fail if size is too big
boost::system::error_code serialize_header(std::size_t size, std::span<unsigned char, header_size> to);

}  // namespace protocol
}  // namespace grpcframe

#endif
