/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <vector>

namespace utils {

// A forward-only stream over buffers already in memory. With a non-zero
// fragment size the data is handed out in pieces of at most that many bytes,
// the way a socket or a file would deliver it.
seastar::input_stream<char> make_buffer_input_stream(seastar::temporary_buffer<char> buf, size_t fragment_size = 0);
seastar::input_stream<char> make_buffer_input_stream(std::vector<seastar::temporary_buffer<char>> bufs);

} // namespace utils
