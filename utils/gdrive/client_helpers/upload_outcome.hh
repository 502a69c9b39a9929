/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <seastar/http/reply.hh>

#include "utils/gdrive/drive_error.hh"
#include "utils/gdrive/file_metadata.hh"

namespace gdrive {

// What the service said about one chunk.
struct upload_outcome {
    // 308: stored, send the bytes starting at next_offset.
    struct incomplete {
        uint64_t next_offset;
    };
    // 200/201: the object exists, described by the body.
    struct completed {
        file_metadata metadata;
    };
    // Anything else.
    struct failed {
        int status;
        drive_error error;
    };

    std::variant<incomplete, completed, failed> value;

    bool is_completed() const noexcept { return std::holds_alternative<completed>(value); }
    bool is_failed() const noexcept { return std::holds_alternative<failed>(value); }
};

// next_offset is where the cursor goes if the chunk was accepted. Throws
// protocol_error if a completion body is not a file resource.
upload_outcome classify_reply(seastar::http::reply::status_type status, std::string_view body, uint64_t next_offset);

} // namespace gdrive
