/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"

#include <boost/regex.hpp>
#include <charconv>
#include <fmt/format.h>
#include <limits>
#include <memory>

#include "utils/gdrive/drive_error.hh"

namespace gdrive {

std::string format_content_range(uint64_t start, uint64_t length, uint64_t total) {
    if (length == 0) {
        return fmt::format("bytes */{}", total);
    }
    return fmt::format("bytes {}-{}/{}", start, start + length - 1, total);
}

uint64_t parse_committed_range(std::string_view range) {
    // $1 is the last byte index the service holds
    static const boost::regex range_re(R"(^(?:bytes=)?0-(\d+)$)");

    boost::cmatch m;
    if (!boost::regex_match(range.begin(), range.end(), m, range_re)) {
        throw protocol_error(fmt::format("unable to parse range \"{}\"", range));
    }
    uint64_t last = 0;
    auto digits = std::string_view(m[1].first, m[1].length());
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), last);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || last == std::numeric_limits<uint64_t>::max()) {
        throw protocol_error(fmt::format("unable to parse range \"{}\"", range));
    }
    return last + 1;
}

Json::Value parse_json(std::string_view body, std::string_view what) {
    Json::CharReaderBuilder rbuilder;
    std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw protocol_error(fmt::format("cannot parse {}: {}", what, errors));
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder wbuilder;
    wbuilder.settings_["indentation"] = "";
    return Json::writeString(wbuilder, value);
}

} // namespace gdrive
