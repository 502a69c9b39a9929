/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

namespace gdrive {

// Holds the next chunk of a forward-only stream so it can be sent as many
// times as needed. Only load() touches the source; rewinding and reading
// replay the scratch buffer, which is allocated once and reused for every
// chunk.
class repeatable_chunk_reader {
    seastar::input_stream<char>& _source;
    seastar::temporary_buffer<char> _scratch;
    size_t _size = 0;
    size_t _pos = 0;
    uint64_t _consumed = 0;

public:
    static constexpr size_t transmit_unit = 64 * 1024;

    repeatable_chunk_reader(seastar::input_stream<char>& source, size_t capacity);

    // Replaces the held chunk with exactly the next n bytes of the source.
    // Throws short_read_error if the source ends first, std::invalid_argument
    // if n exceeds the capacity.
    seastar::future<> load(size_t n);

    void rewind() noexcept { _pos = 0; }
    // Up to max bytes from the replay cursor, sharing the scratch memory.
    seastar::temporary_buffer<char> read(size_t max);

    std::string_view view() const noexcept { return std::string_view(_scratch.get(), _size); }
    size_t size() const noexcept { return _size; }
    size_t remaining() const noexcept { return _size - _pos; }
    size_t capacity() const noexcept { return _scratch.size(); }
    // Bytes taken from the source so far.
    uint64_t consumed() const noexcept { return _consumed; }

    // Body writer for a request: the whole chunk from its first byte,
    // closing the stream afterwards.
    seastar::future<> write_to(seastar::output_stream<char>&& out);
};

} // namespace gdrive
