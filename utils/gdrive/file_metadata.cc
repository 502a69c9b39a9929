/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "file_metadata.hh"

#include <charconv>

#include "utils/gdrive/drive_error.hh"
#include "utils/gdrive/utils/client_utils.hh"

namespace gdrive {

file_metadata::file_metadata(Json::Value doc)
    : _doc(std::move(doc)) {
    if (!_doc.isObject()) {
        throw protocol_error("file resource is not a JSON object");
    }
}

file_metadata file_metadata::parse(std::string_view body) {
    return file_metadata(parse_json(body, "file resource"));
}

std::string file_metadata::get_string(const char* key) const {
    const auto& v = _doc[key];
    return v.isString() ? v.asString() : std::string();
}

std::vector<std::string> file_metadata::parents() const {
    std::vector<std::string> ret;
    const auto& parents = _doc["parents"];
    if (parents.isArray()) {
        for (const auto& p : parents) {
            if (p.isString()) {
                ret.push_back(p.asString());
            }
        }
    }
    return ret;
}

std::optional<uint64_t> file_metadata::size() const {
    const auto& v = _doc["size"];
    if (v.isUInt64()) {
        return v.asUInt64();
    }
    if (v.isString()) {
        auto s = v.asString();
        uint64_t ret;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
        if (ec == std::errc() && ptr == s.data() + s.size()) {
            return ret;
        }
    }
    return std::nullopt;
}

file_metadata& file_metadata::set_name(std::string name) {
    _doc["name"] = std::move(name);
    return *this;
}

file_metadata& file_metadata::set_mime_type(std::string mime_type) {
    _doc["mimeType"] = std::move(mime_type);
    return *this;
}

file_metadata& file_metadata::set_description(std::string description) {
    _doc["description"] = std::move(description);
    return *this;
}

file_metadata& file_metadata::set_modified_time(std::string rfc3339) {
    _doc["modifiedTime"] = std::move(rfc3339);
    return *this;
}

file_metadata& file_metadata::add_parent(std::string parent_id) {
    _doc["parents"].append(std::move(parent_id));
    return *this;
}

file_metadata& file_metadata::set_property(const std::string& key, const std::string& value) {
    _doc["properties"][key] = value;
    return *this;
}

std::string file_metadata::to_json() const {
    return write_json(_doc);
}

} // namespace gdrive

auto fmt::formatter<gdrive::file_metadata>::format(const gdrive::file_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{{id={}, name={}}}", md.id(), md.name());
}
