//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_READ_MESSAGE_FSM_HPP
#define GRPCFRAME_PROTOCOL_READ_MESSAGE_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "grpcframe/framing_params.hpp"
#include "grpcframe/protocol/read_frame_fsm.hpp"

namespace grpcframe::protocol {

struct stream_state;

enum class read_mode
{
    // Exactly one message must be read, and the stream must end right after it
    single,

    // A message must be read, and more data may follow it. Reading from
    // a stream that ended cleanly yields no message.
    multiple,
};

// Reads a single message from the stream, using the buffers in stream_state.
// Bytes after the message are left in the read buffer for the next operation.
// Flow should be:
//   - Create a new FSM per message
//   - Call resume() with an empty error code and zero bytes
//   - If resume returns read, read some bytes into result::read_buffer(), then
//     call resume again passing the read outcome
//   - If resume returns done with an error, the message couldn't be read and
//     release_message() returns an empty optional.
//     Errors are not recoverable, except for read_cancelled.
//   - If resume returns done without error, call release_message(). An empty optional
//     means that the stream ended (only in read_mode::multiple).
class read_message_fsm
{
public:
    enum class result_type
    {
        read,
        done,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::done), ec_(ec) {}
        result(std::span<unsigned char> read_buff) noexcept : type_(result_type::read), read_buff_(read_buff)
        {
        }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::done);
            return ec_;
        }

        std::span<unsigned char> read_buffer() const
        {
            BOOST_ASSERT(type_ == result_type::read);
            return read_buff_;
        }

    private:
        result_type type_;

        union
        {
            boost::system::error_code ec_;
            std::span<unsigned char> read_buff_;
        };
    };

    read_message_fsm(read_mode mode, const framing_params& params) noexcept
        : mode_(mode), params_(&params), frame_fsm_(params.max_receive_message_size)
    {
    }

    read_mode mode() const { return mode_; }

    result resume(stream_state& st, boost::system::error_code io_ec, std::size_t bytes_read);

    // The message that was read, if any. Empty after resume returns done with an error
    std::optional<std::vector<unsigned char>> release_message() { return std::move(message_); }

private:
    result resume_impl(stream_state& st, boost::system::error_code io_ec, std::size_t bytes_read);

    int resume_point_{0};
    read_mode mode_;
    const framing_params* params_;
    std::optional<std::vector<unsigned char>> message_;
    read_frame_fsm frame_fsm_;
    std::size_t read_hint_{};
};

}  // namespace grpcframe::protocol

#endif
