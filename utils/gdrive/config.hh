/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <seastar/core/shared_ptr.hh>

namespace YAML {
    class Node;
}

namespace gdrive {

struct upload_config {
    static constexpr std::string_view default_upload_url = "https://www.googleapis.com/upload/drive/v3/files";
    static constexpr std::string_view default_fields = "id,name,size,md5Checksum,trashed,modifiedTime,createdTime,mimeType,parents,webViewLink";
    static constexpr uint64_t default_chunk_size = 8 << 20;
    // The service only accepts chunks (other than the last) in multiples of this.
    static constexpr uint64_t chunk_granularity = 256 << 10;

    std::string upload_url = std::string(default_upload_url);
    uint64_t chunk_size = default_chunk_size;
    std::string fields = std::string(default_fields);
    bool team_drive = false;
    bool keep_revision_forever = false;
    // Passed through verbatim as query parameters of the session request.
    std::map<std::string, std::string> extra_parameters;

    unsigned max_retries = 10;
    unsigned backoff_scale_ms = 100;
    unsigned max_backoff_ms = 2000;
    std::optional<unsigned> max_connections;
    unsigned max_concurrent_calls = 10;

    static upload_config decode(const YAML::Node&);
    static upload_config parse(std::string_view yaml);
};

using upload_config_ptr = seastar::lw_shared_ptr<const upload_config>;

upload_config_ptr make_upload_config(upload_config cfg);

// "8M", "256Ki", "1G", "1048576"; binary multiples throughout.
uint64_t parse_size(std::string_view size);

} // namespace gdrive

template <>
struct fmt::formatter<gdrive::upload_config> : fmt::formatter<std::string_view> {
    auto format(const gdrive::upload_config&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
