//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_PROTOCOL_READ_BUFFER_HPP
#define GRPCFRAME_PROTOCOL_READ_BUFFER_HPP

#include <boost/beast/core/flat_buffer.hpp>

#include <cstddef>
#include <span>

namespace grpcframe::protocol {

// A read buffer that tracks two cursors over the bytes received from the transport:
//   - consumed: bytes that were extracted into a frame. These are discarded.
//   - examined: bytes that were inspected, but didn't contain a complete frame.
//     These are kept, and no further parsing makes sense until new bytes arrive.
// New bytes are always appended after the unconsumed tail.
class read_buffer
{
    boost::beast::flat_buffer buff_;
    std::size_t examined_{};
    bool eof_{};

public:
    read_buffer() = default;

    // The bytes that haven't been consumed yet
    std::span<const unsigned char> data() const noexcept;

    std::size_t size() const noexcept { return buff_.size(); }

    // How many bytes of data() have been examined
    std::size_t examined() const noexcept { return examined_; }

    // Whether data() contains bytes that nobody has looked at yet
    bool has_unexamined() const noexcept { return examined_ < buff_.size(); }

    // Space to read bytes into, placed after data()
    std::span<unsigned char> prepare(std::size_t n);

    // Adds n bytes from the previous prepare() to data()
    void commit(std::size_t n);

    // Discards the first consumed bytes and marks the first examined
    // bytes (measured from the current start) as examined.
    // Requires consumed <= examined <= size()
    void advance_to(std::size_t consumed, std::size_t examined) noexcept;

    // The transport won't ever produce more bytes
    bool eof() const noexcept { return eof_; }
    void set_eof() noexcept { eof_ = true; }

    // Drops all buffered bytes and state, keeping the allocated memory
    void reset() noexcept;
};

}  // namespace grpcframe::protocol

#endif
