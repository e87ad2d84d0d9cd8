//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_WRITE_MESSAGE_HPP
#define GRPCFRAME_PROTOCOL_WRITE_MESSAGE_HPP

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <span>
#include <vector>

#include "grpcframe/protocol/header.hpp"

namespace grpcframe::protocol {

// Appends a frame containing payload to a DynamicBuffer (e.g. boost::beast::flat_buffer).
// Frames are never compressed. If the payload is too big, the sink is left untouched
template <class DynamicBuffer>
boost::system::error_code write_message(DynamicBuffer& sink, std::span<const unsigned char> payload)
{
    // Header
    std::array<unsigned char, header_size> header{};
    if (auto ec = serialize_header(payload.size(), header))
        return ec;
    sink.commit(boost::asio::buffer_copy(sink.prepare(header_size), boost::asio::buffer(header)));

    // Payload
    sink.commit(boost::asio::buffer_copy(
        sink.prepare(payload.size()),
        boost::asio::buffer(payload.data(), payload.size())
    ));

    return boost::system::error_code();
}

// Appends a complete frame to a byte vector
boost::system::error_code serialize_frame(std::span<const unsigned char> payload, std::vector<unsigned char>& to);

}  // namespace grpcframe::protocol

#endif
