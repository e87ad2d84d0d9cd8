//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "grpcframe/logging.hpp"
#include "grpcframe/message_stream.hpp"

namespace asio = boost::asio;
using namespace grpcframe;
using tcp_message_stream = message_stream<asio::ip::tcp::socket>;

static std::span<const unsigned char> to_span(std::string_view s)
{
    return {reinterpret_cast<const unsigned char*>(s.data()), s.size()};
}

static std::string_view to_string_view(const std::vector<unsigned char>& v)
{
    return {reinterpret_cast<const char*>(v.data()), v.size()};
}

// Echoes every message back to the client, until the client finishes sending
static asio::awaitable<void> run_server(asio::ip::tcp::acceptor& acceptor)
{
    tcp_message_stream stream{co_await acceptor.async_accept(asio::use_awaitable)};

    while (true)
    {
        auto msg = co_await stream.async_read_message(protocol::read_mode::multiple, asio::use_awaitable);
        if (!msg)
            break;
        std::cout << "Server: got " << msg->size() << " bytes\n";
        co_await stream.async_write_message(*msg, true, asio::use_awaitable);
    }

    stream.next_layer().shutdown(asio::ip::tcp::socket::shutdown_send);
}

static asio::awaitable<void> run_client(asio::ip::tcp::endpoint ep)
{
    asio::ip::tcp::socket sock{co_await asio::this_coro::executor};
    co_await sock.async_connect(ep, asio::use_awaitable);
    tcp_message_stream stream{std::move(sock)};

    // The first two messages are buffered and sent together with the third
    co_await stream.async_write_message(to_span("Hello"), false, asio::use_awaitable);
    co_await stream.async_write_message(to_span(""), false, asio::use_awaitable);
    co_await stream.async_write_message(to_span("world"), true, asio::use_awaitable);
    stream.next_layer().shutdown(asio::ip::tcp::socket::shutdown_send);

    while (auto msg = co_await stream.async_read_message(protocol::read_mode::multiple, asio::use_awaitable))
        std::cout << "Client: echoed '" << to_string_view(*msg) << "'\n";

    std::cout << "Done\n";
}

int main()
{
    log::set_level(log::severity::info);

    asio::io_context ctx;
    asio::ip::tcp::acceptor acceptor{ctx, {asio::ip::address_v4::loopback(), 0}};

    auto on_done = [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    };
    asio::co_spawn(ctx, run_server(acceptor), on_done);
    asio::co_spawn(ctx, run_client(acceptor.local_endpoint()), on_done);

    ctx.run();
}
