//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/error.hpp>
#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cstddef>
#include <span>

#include "coroutine.hpp"
#include "grpcframe/framing_errc.hpp"
#include "grpcframe/logging.hpp"
#include "grpcframe/protocol/header.hpp"
#include "grpcframe/protocol/read_frame_fsm.hpp"
#include "grpcframe/protocol/read_message_fsm.hpp"
#include "grpcframe/protocol/stream_state.hpp"

using namespace grpcframe::protocol;
using boost::system::error_code;
using grpcframe::framing_errc;

read_frame_fsm::result read_frame_fsm::resume(std::span<const unsigned char> data)
{
    if (!header_parsed_)
    {
        // Header. Ensure we have enough data
        if (data.size() < header_size)
            return result(static_cast<std::size_t>(header_size - data.size()));

        // Do the parsing
        frame_header header{};
        if (auto ec = parse_header(data.first<header_size>(), header))
            return ec;

        // TODO: support compressed messages once a codec is available
        if (header.compressed)
            return error_code(framing_errc::unsupported_compression);

        // The configured limit may be lower than the protocol one
        if (header.size > max_size_)
            return error_code(framing_errc::message_too_large);

        // Record the header fields to signal that we're done with the header
        frame_size_ = header.size;
        header_parsed_ = true;
    }

    // Payload. Ensure we have enough data. The header is not discarded
    // until the frame is complete for simplicity
    const auto expected_size = header_size + frame_size_;
    if (data.size() < expected_size)
        return result(static_cast<std::size_t>(expected_size - data.size()));

    return result(data.subspan(header_size, frame_size_), expected_size);
}

read_message_fsm::result read_message_fsm::resume(
    stream_state& st,
    boost::system::error_code io_ec,
    std::size_t bytes_read
)
{
    auto res = resume_impl(st, io_ec, bytes_read);

    // A failed read never yields a message, even if a complete frame was extracted
    if (res.type() == result_type::done && res.error())
        message_.reset();
    return res;
}

read_message_fsm::result read_message_fsm::resume_impl(
    stream_state& st,
    boost::system::error_code io_ec,
    std::size_t bytes_read
)
{
    read_frame_fsm::result res{error_code()};

    switch (resume_point_)
    {
        GRPCFRAME_CORO_INITIAL

        while (true)
        {
            // Only read if everything we have has already been examined.
            // Once the transport signalled completion, we don't read anymore
            if (!st.read_buf.has_unexamined() && !st.read_buf.eof())
            {
                // The hint comes from the peer, so it's capped. The buffer
                // grows further only as payload bytes arrive
                GRPCFRAME_YIELD(
                    resume_point_,
                    1,
                    st.read_buf.prepare(
                        (std::max)(params_->read_buffer_size, (std::min)(read_hint_, params_->max_read_size))
                    )
                )

                // Whatever was read is kept, even if there was an error
                st.read_buf.commit(bytes_read);

                // Check for read errors
                if (io_ec == boost::asio::error::operation_aborted)
                    return error_code(framing_errc::read_cancelled);
                else if (io_ec == boost::asio::error::eof)
                    st.read_buf.set_eof();
                else if (io_ec)
                    return io_ec;
            }

            if (st.read_buf.size() > 0u)
            {
                // In single mode, nothing can follow the message
                if (message_.has_value())
                {
                    GRPCFRAME_LOG_DEBUG << "Additional data after the message received ("
                                        << st.read_buf.size() << " bytes)";
                    return error_code(framing_errc::incomplete_message);
                }

                res = frame_fsm_.resume(st.read_buf.data());

                if (res.type() == read_frame_fsm::result_type::error)
                {
                    // An error is always fatal
                    GRPCFRAME_LOG_DEBUG << "Error parsing frame: " << res.error().message();
                    return res.error();
                }
                else if (res.type() == read_frame_fsm::result_type::frame)
                {
                    // Copy the payload, since the read buffer will be reused.
                    // Bytes after the frame remain unexamined
                    message_.emplace(res.payload().begin(), res.payload().end());
                    st.read_buf.advance_to(res.bytes_consumed(), res.bytes_consumed());
                    frame_fsm_ = read_frame_fsm(params_->max_receive_message_size);
                    read_hint_ = 0u;

                    // In multiple mode, we're done. In single mode, make sure that the stream ends
                    if (mode_ == read_mode::multiple)
                        return error_code();
                }
                else
                {
                    BOOST_ASSERT(res.type() == read_frame_fsm::result_type::needs_more);

                    // Nothing consumed, but no point in looking at these bytes again
                    read_hint_ = res.hint();
                    st.read_buf.advance_to(0u, st.read_buf.size());
                }
            }

            if (st.read_buf.eof())
            {
                if (st.read_buf.size() == 0u)
                {
                    // Multiple mode: finished and there is no more data.
                    // Single mode: finished and the complete message has arrived
                    if (mode_ == read_mode::multiple || message_.has_value())
                        return error_code();
                }

                GRPCFRAME_LOG_DEBUG << "Stream ended with an incomplete message ("
                                    << st.read_buf.size() << " bytes buffered)";
                return error_code(framing_errc::incomplete_message);
            }
        }
    }

    BOOST_ASSERT(false);
    return error_code();
}
