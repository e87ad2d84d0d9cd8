//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_READ_FRAME_FSM_HPP
#define GRPCFRAME_PROTOCOL_READ_FRAME_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>

#include "grpcframe/protocol/header.hpp"

namespace grpcframe::protocol {

// A finite-state machine type to extract a single frame from a buffer.
// resume() returns a variant-like type specifying what to do next.
// Flow should be:
//   - Create a new FSM per frame (they're lightweight)
//   - Call resume() passing all the unconsumed bytes available in your read buffer
//   - If resume returns an error, a serious protocol violation happened. Not recoverable.
//   - If resume returns needs_more, we need to read more data from the transport.
//     At least result::hint() bytes are missing. Read and resume again with your entire buffer.
//   - If resume() returns a frame, a frame is available. Copy the payload and then
//     consume result::bytes_consumed(). The payload points into the read buffer,
//     so don't consume before copying.
class read_frame_fsm
{
    std::size_t max_size_;
    std::size_t frame_size_{};
    bool header_parsed_{false};

public:
    enum class result_type
    {
        needs_more,
        error,
        frame,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(std::size_t hint) noexcept : type_(result_type::needs_more), hint_(hint) {}
        result(std::span<const unsigned char> payload, std::size_t bytes_consumed) noexcept
            : type_(result_type::frame), frame_{payload, bytes_consumed}
        {
        }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        std::size_t hint() const
        {
            BOOST_ASSERT(type_ == result_type::needs_more);
            return hint_;
        }

        std::span<const unsigned char> payload() const
        {
            BOOST_ASSERT(type_ == result_type::frame);
            return frame_.payload;
        }

        std::size_t bytes_consumed() const
        {
            BOOST_ASSERT(type_ == result_type::frame);
            return frame_.bytes_consumed;
        }

    private:
        result_type type_;
        struct frame_t
        {
            std::span<const unsigned char> payload;
            std::size_t bytes_consumed;
        };

        union
        {
            boost::system::error_code ec_;
            frame_t frame_;
            std::size_t hint_;
        };
    };

    explicit read_frame_fsm(std::size_t max_size = max_message_size) noexcept : max_size_(max_size) {}

    result resume(std::span<const unsigned char> data);
};

}  // namespace grpcframe::protocol

#endif
