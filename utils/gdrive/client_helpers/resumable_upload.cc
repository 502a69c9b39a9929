/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "resumable_upload.hh"

#include <algorithm>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "utils/gdrive/drive_error.hh"
#include "utils/gdrive/utils/client_utils.hh"

namespace gdrive {

resumable_upload::resumable_upload(shared_ptr<client> cln, upload_session session, input_stream<char> source, upload_progress* progress, abort_source* as)
    : _client(std::move(cln))
    , _session(std::move(session))
    , _source(std::move(source))
    , _progress(progress)
    , _as(as) {
}

future<file_metadata> resumable_upload::upload() {
    return close_after(transfer());
}

future<file_metadata> resumable_upload::resume() {
    return close_after(probe_and_transfer());
}

future<file_metadata> resumable_upload::close_after(future<file_metadata> f) {
    std::optional<file_metadata> ret;
    std::exception_ptr ex;
    try {
        ret = co_await std::move(f);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await _source.close();
    if (ex) {
        ++_client->_stats.uploads_failed;
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    ++_client->_stats.uploads_completed;
    gdrive_log.info("Upload of {} bytes complete: {}", _session.total_size, *ret);
    co_return std::move(*ret);
}

void resumable_upload::advance(uint64_t next_offset) noexcept {
    // A chunk acknowledged twice must not move the cursor back
    if (next_offset <= _committed) {
        return;
    }
    _client->_stats.bytes_committed += next_offset - _committed;
    _committed = next_offset;
    if (_progress) {
        _progress->uploaded = _committed;
    }
}

future<file_metadata> resumable_upload::probe_and_transfer() {
    auto committed = co_await transfer_status();
    if (_result) {
        co_return *_result;
    }
    gdrive_log.info("Resuming upload at {} of {} bytes", committed, _session.total_size);
    co_await _source.skip(committed);
    advance(committed);
    co_return co_await transfer();
}

future<file_metadata> resumable_upload::transfer() {
    // Read at every start so a config update applies to the next upload
    const uint64_t chunk_size = _client->config()->chunk_size;
    const uint64_t total = _session.total_size;
    if (_progress) {
        _progress->total = total;
        _progress->uploaded = _committed;
    }

    repeatable_chunk_reader chunk(_source, std::min(chunk_size, total - _committed));
    // An empty upload still needs one request to be finalized
    do {
        auto req_size = std::min(chunk_size, total - _committed);
        co_await chunk.load(req_size);
        co_await send_chunk(chunk, _committed);
    } while (_committed < total && !_result);

    if (!_result) {
        gdrive_log.warn("Upload of {} bytes ended without confirmation, last status {}", total, _last_status);
        co_await coroutine::return_exception(incomplete_upload_error(_last_status));
    }
    co_return *_result;
}

future<> resumable_upload::send_chunk(repeatable_chunk_reader& chunk, uint64_t start) {
    auto p = _client->get_pacer();
    auto& stats = _client->_stats;
    const auto length = chunk.size();
    std::optional<upload_outcome> outcome;
    unsigned attempts = 0;
    std::exception_ptr ex;

    try {
        co_await p->call([&] () -> future<> {
            if (attempts++) {
                ++stats.chunk_retries;
            }
            ++stats.chunks_sent;
            gdrive_log.debug("Sending chunk {} length {}", start, length);
            outcome.reset();
            _last_status = status_transport_failure;

            std::exception_ptr transfer_ex;
            try {
                co_await transfer_chunk(chunk, start, outcome);
            } catch (...) {
                transfer_ex = std::current_exception();
            }
            if (transfer_ex) {
                if (!outcome || outcome->is_failed()) {
                    co_await coroutine::return_exception_ptr(std::move(transfer_ex));
                }
                // The service already told us what it did with the chunk
                gdrive_log.debug("Ignoring error after status {} for chunk {}: {}", _last_status, start, transfer_ex);
            }
            if (auto* f = std::get_if<upload_outcome::failed>(&outcome->value)) {
                if (f->status == 404) {
                    // The session is gone, only a new one can help
                    co_await coroutine::return_exception(incomplete_upload_error(404, f->error.get_error_message()));
                }
                co_await coroutine::return_exception(drive_exception(f->error));
            }
        }, classify_error, _as);
    } catch (...) {
        ex = std::current_exception();
    }

    if (ex) {
        if (classify_error(ex)) {
            gdrive_log.warn("Giving up on chunk {} length {} after {} attempts: {}", start, length, attempts, ex);
            co_await coroutine::return_exception(incomplete_upload_error(_last_status));
        }
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    if (outcome->is_completed()) {
        _result = std::move(std::get<upload_outcome::completed>(outcome->value).metadata);
        advance(_session.total_size);
    } else {
        advance(std::get<upload_outcome::incomplete>(outcome->value).next_offset);
    }
}

future<> resumable_upload::transfer_chunk(repeatable_chunk_reader& chunk, uint64_t start, std::optional<upload_outcome>& outcome) {
    const auto length = chunk.size();
    auto req = _client->make_session_request(_session);
    req._headers["Content-Range"] = format_content_range(start, length, _session.total_size);
    if (length) {
        req.write_body("bin", length, [&chunk] (output_stream<char>&& out) {
            return chunk.write_to(std::move(out));
        });
    } else {
        req._headers["Content-Length"] = "0";
    }
    if (!_session.content_type.empty()) {
        req._headers["Content-Type"] = _session.content_type;
    }

    co_await _client->make_request(std::move(req), [this, &outcome, next_offset = start + length] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        _last_status = static_cast<int>(rep._status);
        if (is_resume_incomplete(rep._status)) {
            outcome = classify_reply(rep._status, {}, next_offset);
            co_await util::skip_entire_stream(in);
            co_return;
        }
        auto body = co_await util::read_entire_stream_contiguous(in);
        outcome = classify_reply(rep._status, body, next_offset);
    }, _as);
}

future<uint64_t> resumable_upload::transfer_status() {
    auto p = _client->get_pacer();
    const uint64_t total = _session.total_size;
    uint64_t committed = 0;

    co_await p->call([&] () -> future<> {
        auto req = _client->make_session_request(_session);
        req._headers["Content-Range"] = format_content_range(0, 0, total);
        req._headers["Content-Length"] = "0";
        co_await _client->make_request(std::move(req), [&] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
            auto in = std::move(in_);
            auto body = co_await util::read_entire_stream_contiguous(in);
            _last_status = static_cast<int>(rep._status);
            if (is_upload_complete(rep._status)) {
                committed = total;
                // Complete whatever the body holds; metadata only when it describes the file
                try {
                    _result = file_metadata::parse(body);
                } catch (const protocol_error& e) {
                    gdrive_log.warn("Upload of {} bytes is complete but the reply does not describe the file: {}", total, e.what());
                }
            } else if (is_resume_incomplete(rep._status)) {
                committed = parse_committed_range(rep.get_header("Range"));
            } else {
                co_await coroutine::return_exception(drive_exception(drive_error::from_reply(rep._status, body)));
            }
        }, _as);
    }, classify_error, _as);

    if (committed > total) {
        throw protocol_error(fmt::format("service claims {} bytes of a {} byte upload", committed, total));
    }
    gdrive_log.debug("Service holds {} of {} bytes", committed, total);
    co_return committed;
}

} // namespace gdrive
