/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <json/json.h>
#include <seastar/http/reply.hh>
#include <cstdint>
#include <string>
#include <string_view>

namespace gdrive {

// "Resume Incomplete": the chunk was stored and more data is expected.
static constexpr auto status_resume_incomplete = static_cast<seastar::http::reply::status_type>(308);

inline bool is_resume_incomplete(seastar::http::reply::status_type status) noexcept {
    return status == status_resume_incomplete;
}

// 201 for a newly created object, 200 when an existing one was updated.
inline bool is_upload_complete(seastar::http::reply::status_type status) noexcept {
    return status == seastar::http::reply::status_type::ok || status == seastar::http::reply::status_type::created;
}

// "bytes {start}-{end}/{total}" for a chunk of data, "bytes */{total}" for an
// empty one (status query, or the whole of a zero-length upload).
std::string format_content_range(uint64_t start, uint64_t length, uint64_t total);

// Number of bytes the service holds, as told by the Range header of a 308.
// Accepts "0-N" and "bytes=0-N"; throws protocol_error for anything else.
uint64_t parse_committed_range(std::string_view range);

// Throws protocol_error naming `what` when body is not a JSON document.
Json::Value parse_json(std::string_view body, std::string_view what);
std::string write_json(const Json::Value& value);

} // namespace gdrive
