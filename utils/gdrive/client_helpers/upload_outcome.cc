/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_outcome.hh"

#include "utils/gdrive/utils/client_utils.hh"

namespace gdrive {

upload_outcome classify_reply(seastar::http::reply::status_type status, std::string_view body, uint64_t next_offset) {
    if (is_resume_incomplete(status)) {
        return {upload_outcome::incomplete{next_offset}};
    }
    if (is_upload_complete(status)) {
        return {upload_outcome::completed{file_metadata::parse(body)}};
    }
    return {upload_outcome::failed{static_cast<int>(status), drive_error::from_reply(status, body)}};
}

} // namespace gdrive
