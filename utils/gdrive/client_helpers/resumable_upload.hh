/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>

#include "utils/gdrive/client.hh"
#include "utils/gdrive/client_helpers/repeatable_chunk_reader.hh"
#include "utils/gdrive/client_helpers/upload_outcome.hh"
#include "utils/gdrive/file_metadata.hh"

namespace gdrive {

// Sends the content of one session, a chunk at a time, in order. Owns the
// source and closes it when upload() or resume() is done.
class resumable_upload {
    shared_ptr<client> _client;
    upload_session _session;
    input_stream<char> _source;
    upload_progress* _progress;
    abort_source* _as;
    uint64_t _committed = 0;
    std::optional<file_metadata> _result;
    int _last_status = 0;

    future<file_metadata> transfer();
    future<file_metadata> probe_and_transfer();
    future<file_metadata> close_after(future<file_metadata> f);
    future<> send_chunk(repeatable_chunk_reader& chunk, uint64_t start);
    future<> transfer_chunk(repeatable_chunk_reader& chunk, uint64_t start, std::optional<upload_outcome>& outcome);
    void advance(uint64_t next_offset) noexcept;

public:
    resumable_upload(shared_ptr<client> cln, upload_session session, input_stream<char> source, upload_progress* progress, abort_source* as);

    // Sends everything from offset 0.
    future<file_metadata> upload();
    // Asks the service what it has, skips that much of the source and
    // sends the rest.
    future<file_metadata> resume();
    // Bytes the service has committed. A 308 without a usable Range is a
    // protocol_error. When the upload is complete already, the metadata is
    // recorded if the reply carries it.
    future<uint64_t> transfer_status();
};

} // namespace gdrive
