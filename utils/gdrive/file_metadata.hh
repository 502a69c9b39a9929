/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>

namespace gdrive {

// A file resource as the service describes it. Used both for the body of
// the session request and for the document returned once the upload is
// complete; fields the service sends that we don't know about are kept.
class file_metadata {
    Json::Value _doc{Json::objectValue};

    std::string get_string(const char* key) const;

public:
    file_metadata() = default;
    explicit file_metadata(Json::Value doc);

    // Throws protocol_error when body is not a JSON object.
    static file_metadata parse(std::string_view body);

    std::string id() const { return get_string("id"); }
    std::string name() const { return get_string("name"); }
    std::string mime_type() const { return get_string("mimeType"); }
    std::string md5_checksum() const { return get_string("md5Checksum"); }
    std::string modified_time() const { return get_string("modifiedTime"); }
    std::string description() const { return get_string("description"); }
    std::vector<std::string> parents() const;
    // The service reports sizes as decimal strings.
    std::optional<uint64_t> size() const;
    bool empty() const { return _doc.empty(); }

    file_metadata& set_name(std::string name);
    file_metadata& set_mime_type(std::string mime_type);
    file_metadata& set_description(std::string description);
    file_metadata& set_modified_time(std::string rfc3339);
    file_metadata& add_parent(std::string parent_id);
    file_metadata& set_property(const std::string& key, const std::string& value);

    const Json::Value& json() const noexcept { return _doc; }
    std::string to_json() const;
};

} // namespace gdrive

template <>
struct fmt::formatter<gdrive::file_metadata> : fmt::formatter<std::string_view> {
    auto format(const gdrive::file_metadata&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
