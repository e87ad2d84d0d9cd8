//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_STREAM_STATE_HPP
#define GRPCFRAME_PROTOCOL_STREAM_STATE_HPP

#include <boost/beast/core/flat_buffer.hpp>

#include "grpcframe/protocol/read_buffer.hpp"

namespace grpcframe::protocol {

// Buffers owned by the transport. They outlive individual read and write
// operations, so bytes received after a frame are available to the next read
struct stream_state
{
    // Encoded frames waiting to be flushed
    boost::beast::flat_buffer write_buffer;

    // Bytes received from the transport
    read_buffer read_buf;
};

}  // namespace grpcframe::protocol

#endif
