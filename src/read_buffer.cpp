//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/buffer.hpp>
#include <boost/assert.hpp>

#include <cstddef>
#include <span>

#include "grpcframe/protocol/read_buffer.hpp"

using grpcframe::protocol::read_buffer;

std::span<const unsigned char> read_buffer::data() const noexcept
{
    auto buff = buff_.data();
    return {static_cast<const unsigned char*>(buff.data()), buff.size()};
}

std::span<unsigned char> read_buffer::prepare(std::size_t n)
{
    auto buff = buff_.prepare(n);
    return {static_cast<unsigned char*>(buff.data()), buff.size()};
}

void read_buffer::commit(std::size_t n) { buff_.commit(n); }

void read_buffer::advance_to(std::size_t consumed, std::size_t examined) noexcept
{
    BOOST_ASSERT(consumed <= examined);
    BOOST_ASSERT(examined <= buff_.size());
    buff_.consume(consumed);
    examined_ = examined - consumed;
}

void read_buffer::reset() noexcept
{
    buff_.clear();
    examined_ = 0u;
    eof_ = false;
}
