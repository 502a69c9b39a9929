/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "config.hh"

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "utils/log.hh"

using namespace std::string_literals;

namespace gdrive {

static logging::logger cfglog("gdrive_config");

uint64_t parse_size(std::string_view size) {
    static const boost::regex size_re(R"(^\s*(\d+)\s*([KMGT]?)(?:i?B?)?\s*$)", boost::regex::icase);

    boost::cmatch m;
    if (!boost::regex_match(size.begin(), size.end(), m, size_re)) {
        throw std::invalid_argument(fmt::format("Cannot parse size \"{}\"", size));
    }
    uint64_t value = 0;
    auto digits = std::string_view(m[1].first, m[1].length());
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw std::invalid_argument(fmt::format("Cannot parse size \"{}\"", size));
    }
    unsigned shift = 0;
    if (m[2].length()) {
        switch (std::toupper(*m[2].first)) {
        case 'K': shift = 10; break;
        case 'M': shift = 20; break;
        case 'G': shift = 30; break;
        case 'T': shift = 40; break;
        }
    }
    if (shift && value > (std::numeric_limits<uint64_t>::max() >> shift)) {
        throw std::invalid_argument(fmt::format("Size \"{}\" is too large", size));
    }
    return value << shift;
}

upload_config upload_config::decode(const YAML::Node& node) {
    auto get_opt = [&node](const std::string& key, auto def) {
        auto tmp = node[key];
        return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
    };

    upload_config cfg;
    cfg.upload_url = get_opt("upload_url", cfg.upload_url);
    if (auto chunk_size = node["chunk_size"]) {
        cfg.chunk_size = parse_size(chunk_size.as<std::string>());
    }
    cfg.fields = get_opt("fields", cfg.fields);
    cfg.team_drive = get_opt("team_drive", cfg.team_drive);
    cfg.keep_revision_forever = get_opt("keep_revision_forever", cfg.keep_revision_forever);
    if (auto extra = node["extra_parameters"]) {
        if (!extra.IsMap()) {
            throw std::invalid_argument(fmt::format("extra_parameters must be a map: {}", boost::lexical_cast<std::string>(extra)));
        }
        for (const auto& kv : extra) {
            cfg.extra_parameters.emplace(kv.first.as<std::string>(), kv.second.as<std::string>());
        }
    }
    cfg.max_retries = get_opt("max_retries", cfg.max_retries);
    cfg.backoff_scale_ms = get_opt("backoff_scale_ms", cfg.backoff_scale_ms);
    cfg.max_backoff_ms = get_opt("max_backoff_ms", cfg.max_backoff_ms);
    if (auto max_connections = node["max_connections"]) {
        cfg.max_connections = max_connections.as<unsigned>();
    }
    cfg.max_concurrent_calls = get_opt("max_concurrent_calls", cfg.max_concurrent_calls);

    if (cfg.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (cfg.chunk_size % chunk_granularity) {
        cfglog.warn("chunk_size {} is not a multiple of {}, the service may reject non-final chunks", cfg.chunk_size, chunk_granularity);
    }
    if (cfg.max_concurrent_calls == 0) {
        throw std::invalid_argument("max_concurrent_calls must be positive");
    }
    return cfg;
}

upload_config upload_config::parse(std::string_view yaml) {
    auto node = YAML::Load(std::string(yaml));
    if (node.IsNull()) {
        return upload_config{};
    }
    return decode(node);
}

upload_config_ptr make_upload_config(upload_config cfg) {
    return seastar::make_lw_shared<const upload_config>(std::move(cfg));
}

} // namespace gdrive

auto fmt::formatter<gdrive::upload_config>::format(const gdrive::upload_config& cfg, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "upload_config{{url={}, chunk_size={}, team_drive={}, keep_revision_forever={}, max_retries={}}}",
            cfg.upload_url, cfg.chunk_size, cfg.team_drive, cfg.keep_revision_forever, cfg.max_retries);
}
