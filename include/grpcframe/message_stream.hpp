//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_MESSAGE_STREAM_HPP
#define GRPCFRAME_MESSAGE_STREAM_HPP

#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "grpcframe/framing_errc.hpp"
#include "grpcframe/framing_params.hpp"
#include "grpcframe/logging.hpp"
#include "grpcframe/protocol/read_message_fsm.hpp"
#include "grpcframe/protocol/stream_state.hpp"
#include "grpcframe/protocol/write_message.hpp"

namespace grpcframe {

using message_signature = void(boost::system::error_code, std::optional<std::vector<unsigned char>>);

namespace detail {

template <class Stream>
struct message_stream_impl
{
    Stream stream;
    protocol::stream_state st{};

    explicit message_stream_impl(Stream s) : stream(std::move(s)) {}
};

template <class Stream>
struct read_message_op
{
    message_stream_impl<Stream>& impl;
    protocol::read_message_fsm fsm_;
    bool suspended_{false};
    bool completing_{false};
    boost::system::error_code stored_ec_{};

    template <class Self>
    void operator()(Self& self, boost::system::error_code ec = {}, std::size_t bytes_transferred = {})
    {
        // Completing after a post
        if (completing_)
        {
            complete(self);
            return;
        }

        auto res = fsm_.resume(impl.st, ec, bytes_transferred);
        if (res.type() == protocol::read_message_fsm::result_type::read)
        {
            suspended_ = true;
            auto buff = res.read_buffer();
            impl.stream.async_read_some(boost::asio::buffer(buff.data(), buff.size()), std::move(self));
            return;
        }

        // Don't call the handler from within the initiating function
        stored_ec_ = res.error();
        if (!suspended_)
        {
            completing_ = true;
            boost::asio::post(std::move(self));
        }
        else
        {
            complete(self);
        }
    }

    template <class Self>
    void complete(Self& self)
    {
        if (stored_ec_)
        {
            GRPCFRAME_LOG_DEBUG << "Error reading message: " << stored_ec_.message();
            self.complete(stored_ec_, std::nullopt);
            return;
        }

        auto msg = fsm_.release_message();
        if (msg)
            GRPCFRAME_LOG_TRACE << "Read message of " << msg->size() << " bytes";
        else
            GRPCFRAME_LOG_TRACE << "End of stream";
        self.complete(boost::system::error_code(), std::move(msg));
    }
};

template <class Stream>
struct write_message_op
{
    message_stream_impl<Stream>& impl;
    std::span<const unsigned char> payload_;  // Only used before the first suspension
    std::size_t max_size_;
    bool flush_;
    int resume_point_{0};
    boost::system::error_code stored_ec_{};

    template <class Self>
    void operator()(Self& self, boost::system::error_code ec = {}, std::size_t bytes_transferred = {})
    {
        switch (resume_point_)
        {
            case 0:
                // Encode the message into the write buffer
                if (payload_.size() > max_size_)
                    stored_ec_ = framing_errc::message_too_large;
                else
                    stored_ec_ = protocol::write_message(impl.st.write_buffer, payload_);

                // If there is nothing to send, just complete. Don't call the handler
                // from within the initiating function
                if (stored_ec_ || !flush_)
                {
                    if (stored_ec_)
                        GRPCFRAME_LOG_DEBUG << "Error writing message: " << stored_ec_.message();
                    else
                        GRPCFRAME_LOG_TRACE << "Buffered message of " << payload_.size() << " bytes";
                    resume_point_ = 1;
                    boost::asio::post(std::move(self));
                    return;
                }

                // Flush
                GRPCFRAME_LOG_TRACE << "Writing message of " << payload_.size() << " bytes ("
                                    << impl.st.write_buffer.size() << " bytes buffered)";
                resume_point_ = 2;
                boost::asio::async_write(impl.stream, impl.st.write_buffer.data(), std::move(self));
                return;

            case 1: self.complete(stored_ec_); return;

            case 2:
                // Bytes that reached the transport are never written again
                impl.st.write_buffer.consume(bytes_transferred);
                if (ec)
                    GRPCFRAME_LOG_DEBUG << "Error flushing: " << ec.message();
                self.complete(ec);
                return;

            default: BOOST_ASSERT(false);
        }
    }
};

template <class Stream>
struct flush_op
{
    message_stream_impl<Stream>& impl;
    int resume_point_{0};

    template <class Self>
    void operator()(Self& self, boost::system::error_code ec = {}, std::size_t bytes_transferred = {})
    {
        switch (resume_point_)
        {
            case 0:
                if (impl.st.write_buffer.size() == 0u)
                {
                    resume_point_ = 1;
                    boost::asio::post(std::move(self));
                    return;
                }
                resume_point_ = 2;
                boost::asio::async_write(impl.stream, impl.st.write_buffer.data(), std::move(self));
                return;

            case 1: self.complete(boost::system::error_code()); return;

            case 2:
                impl.st.write_buffer.consume(bytes_transferred);
                if (ec)
                    GRPCFRAME_LOG_DEBUG << "Error flushing: " << ec.message();
                self.complete(ec);
                return;

            default: BOOST_ASSERT(false);
        }
    }
};

}  // namespace detail

// Reads and writes gRPC length-prefixed messages over a stream (e.g. a TCP socket).
// At most one read and one write may be outstanding at any time.
template <class Stream>
class message_stream
{
    detail::message_stream_impl<Stream> impl_;
    framing_params params_;

public:
    using executor_type = typename Stream::executor_type;
    using next_layer_type = Stream;

    explicit message_stream(Stream stream, const framing_params& params = {})
        : impl_(std::move(stream)), params_(params)
    {
    }

    executor_type get_executor() { return impl_.stream.get_executor(); }

    Stream& next_layer() noexcept { return impl_.stream; }
    const Stream& next_layer() const noexcept { return impl_.stream; }

    const framing_params& params() const noexcept { return params_; }

    // Bytes buffered by async_write_message(flush=false) and not flushed yet
    std::size_t pending_write_size() const noexcept { return impl_.st.write_buffer.size(); }

    // Reads a message. Completes with an empty optional if the stream ended cleanly
    // (only in read_mode::multiple). Unconsumed bytes are kept for the next read
    template <
        boost::asio::completion_token_for<message_signature> CompletionToken =
            boost::asio::default_completion_token_t<executor_type>>
    auto async_read_message(
        protocol::read_mode mode,
        CompletionToken&& token = boost::asio::default_completion_token_t<executor_type>()
    )
    {
        return boost::asio::async_compose<CompletionToken, message_signature>(
            detail::read_message_op<Stream>{impl_, protocol::read_message_fsm{mode, params_}},
            token,
            impl_.stream
        );
    }

    // Encodes a message into the write buffer. If flush is true, sends all
    // buffered bytes to the transport. The payload must remain valid until the
    // operation completes
    template <
        boost::asio::completion_token_for<void(boost::system::error_code)> CompletionToken =
            boost::asio::default_completion_token_t<executor_type>>
    auto async_write_message(
        std::span<const unsigned char> payload,
        bool flush,
        CompletionToken&& token = boost::asio::default_completion_token_t<executor_type>()
    )
    {
        return boost::asio::async_compose<CompletionToken, void(boost::system::error_code)>(
            detail::write_message_op<Stream>{impl_, payload, params_.max_send_message_size, flush},
            token,
            impl_.stream
        );
    }

    // Sends all buffered bytes to the transport
    template <
        boost::asio::completion_token_for<void(boost::system::error_code)> CompletionToken =
            boost::asio::default_completion_token_t<executor_type>>
    auto async_flush(CompletionToken&& token = boost::asio::default_completion_token_t<executor_type>())
    {
        return boost::asio::async_compose<CompletionToken, void(boost::system::error_code)>(
            detail::flush_op<Stream>{impl_},
            token,
            impl_.stream
        );
    }
};

}  // namespace grpcframe

#endif
