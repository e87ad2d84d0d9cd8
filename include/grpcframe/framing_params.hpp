//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_FRAMING_PARAMS_HPP
#define GRPCFRAME_FRAMING_PARAMS_HPP

#include <cstddef>

#include "grpcframe/protocol/header.hpp"

namespace grpcframe {

struct framing_params
{
    // Frames declaring a bigger length are rejected as soon as their header is read
    std::size_t max_receive_message_size{protocol::max_message_size};

    // Payloads bigger than this are rejected before being written
    std::size_t max_send_message_size{protocol::max_message_size};

    // Minimum number of bytes requested from the transport on each read
    std::size_t read_buffer_size{4096};

    // Reads are sized to fit the rest of the frame being received, up to this
    // many bytes. read_buffer_size takes precedence if it's bigger
    std::size_t max_read_size{64u * 1024u};
};

}  // namespace grpcframe

#endif
