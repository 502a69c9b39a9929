/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "repeatable_chunk_reader.hh"

#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/gdrive/drive_error.hh"

using namespace seastar;

namespace gdrive {

repeatable_chunk_reader::repeatable_chunk_reader(input_stream<char>& source, size_t capacity)
    : _source(source)
    , _scratch(capacity) {
}

future<> repeatable_chunk_reader::load(size_t n) {
    if (n > _scratch.size()) {
        throw std::invalid_argument(fmt::format("chunk of {} bytes does not fit the {} byte buffer", n, _scratch.size()));
    }
    _size = 0;
    _pos = 0;
    while (_size < n) {
        auto buf = co_await _source.read_up_to(n - _size);
        if (buf.empty()) {
            _consumed += _size;
            co_await coroutine::return_exception(short_read_error(_consumed - _size + n, _consumed));
        }
        std::copy_n(buf.get(), buf.size(), _scratch.get_write() + _size);
        _size += buf.size();
    }
    _consumed += n;
}

temporary_buffer<char> repeatable_chunk_reader::read(size_t max) {
    auto len = std::min(max, remaining());
    auto ret = _scratch.share(_pos, len);
    _pos += len;
    return ret;
}

future<> repeatable_chunk_reader::write_to(output_stream<char>&& out_) {
    auto out = std::move(out_);
    std::exception_ptr ex;
    try {
        rewind();
        while (remaining()) {
            auto buf = read(transmit_unit);
            co_await out.write(buf.get(), buf.size());
        }
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

} // namespace gdrive
