/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "buffer_input_stream.hh"

#include <deque>

namespace utils {

using namespace seastar;

class buffer_data_source_impl final : public data_source_impl {
    std::deque<temporary_buffer<char>> _bufs;
public:
    explicit buffer_data_source_impl(std::deque<temporary_buffer<char>> bufs)
        : _bufs(std::move(bufs))
    {}

    virtual future<temporary_buffer<char>> get() override {
        while (!_bufs.empty() && _bufs.front().empty()) {
            _bufs.pop_front();
        }
        if (_bufs.empty()) {
            return make_ready_future<temporary_buffer<char>>();
        }
        auto buf = std::move(_bufs.front());
        _bufs.pop_front();
        return make_ready_future<temporary_buffer<char>>(std::move(buf));
    }

    virtual future<temporary_buffer<char>> skip(uint64_t n) override {
        while (n && !_bufs.empty()) {
            auto& front = _bufs.front();
            if (front.size() > n) {
                front.trim_front(n);
                break;
            }
            n -= front.size();
            _bufs.pop_front();
        }
        return make_ready_future<temporary_buffer<char>>();
    }

    virtual future<> close() override {
        _bufs.clear();
        return make_ready_future<>();
    }
};

input_stream<char> make_buffer_input_stream(temporary_buffer<char> buf, size_t fragment_size) {
    std::deque<temporary_buffer<char>> bufs;
    if (fragment_size == 0 || buf.size() <= fragment_size) {
        bufs.emplace_back(std::move(buf));
    } else {
        for (size_t off = 0; off < buf.size(); off += fragment_size) {
            bufs.emplace_back(buf.share(off, std::min(fragment_size, buf.size() - off)));
        }
    }
    return input_stream<char>(data_source(std::make_unique<buffer_data_source_impl>(std::move(bufs))));
}

input_stream<char> make_buffer_input_stream(std::vector<temporary_buffer<char>> bufs) {
    return input_stream<char>(data_source(std::make_unique<buffer_data_source_impl>(
            std::deque<temporary_buffer<char>>(std::make_move_iterator(bufs.begin()), std::make_move_iterator(bufs.end())))));
}

} // namespace utils
