/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "drive_error.hh"

#include <seastar/core/abort_source.hh>
#include <seastar/core/timed_out_error.hh>

#include "utils/gdrive/utils/client_utils.hh"

namespace gdrive {

drive_error::drive_error(drive_error_type error_type, retryable is_retryable)
    : drive_error(error_type, "", is_retryable) {
}

drive_error::drive_error(drive_error_type error_type, std::string message, retryable is_retryable)
    : _type(error_type), _message(std::move(message)), _is_retryable(is_retryable) {
}

// https://developers.google.com/drive/api/guides/handle-errors
const drive_errors drive_error_map = {
    {"rateLimitExceeded", drive_error(drive_error_type::RATE_LIMIT_EXCEEDED, retryable::yes)},
    {"userRateLimitExceeded", drive_error(drive_error_type::USER_RATE_LIMIT_EXCEEDED, retryable::yes)},
    {"sharingRateLimitExceeded", drive_error(drive_error_type::SHARING_RATE_LIMIT_EXCEEDED, retryable::no)},
    {"backendError", drive_error(drive_error_type::BACKEND_ERROR, retryable::yes)},
    {"internalError", drive_error(drive_error_type::INTERNAL_ERROR, retryable::yes)},
    {"notFound", drive_error(drive_error_type::NOT_FOUND, retryable::no)},
    {"authError", drive_error(drive_error_type::AUTH_ERROR, retryable::no)},
    {"insufficientFilePermissions", drive_error(drive_error_type::INSUFFICIENT_PERMISSIONS, retryable::no)},
    {"storageQuotaExceeded", drive_error(drive_error_type::STORAGE_QUOTA_EXCEEDED, retryable::no)},
    {"uploadTooLarge", drive_error(drive_error_type::UPLOAD_TOO_LARGE, retryable::no)},
    {"invalid", drive_error(drive_error_type::INVALID_ARGUMENT, retryable::no)},
    {"badRequest", drive_error(drive_error_type::INVALID_ARGUMENT, retryable::no)},
};

std::optional<drive_error> drive_error::parse(std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }
    Json::Value doc;
    try {
        doc = parse_json(body, "error response");
    } catch (const protocol_error&) {
        return std::nullopt;
    }
    if (!doc.isObject() || !doc["error"].isObject()) {
        return std::nullopt;
    }
    const auto& error = doc["error"];
    std::string message = error.get("message", "").asString();

    drive_error ret(drive_error_type::UNKNOWN, message, retryable::no);
    const auto& errors = error["errors"];
    if (errors.isArray() && !errors.empty() && errors[0].isObject()) {
        auto reason = errors[0].get("reason", "").asString();
        if (auto it = drive_error_map.find(reason); it != drive_error_map.end()) {
            ret._type = it->second._type;
            ret._is_retryable = it->second._is_retryable;
        }
    }
    if (error["code"].isIntegral()) {
        ret._status = error["code"].asInt();
    }
    return ret;
}

drive_error drive_error::from_http_code(seastar::http::reply::status_type http_code) {
    drive_error_type type;
    switch (static_cast<int>(http_code)) {
    case 400: type = drive_error_type::HTTP_BAD_REQUEST; break;
    case 401: type = drive_error_type::HTTP_UNAUTHORIZED; break;
    case 403: type = drive_error_type::HTTP_FORBIDDEN; break;
    case 404: type = drive_error_type::HTTP_NOT_FOUND; break;
    case 408: type = drive_error_type::HTTP_REQUEST_TIMEOUT; break;
    case 429: type = drive_error_type::HTTP_TOO_MANY_REQUESTS; break;
    case 500: type = drive_error_type::HTTP_INTERNAL_SERVER_ERROR; break;
    case 502: type = drive_error_type::HTTP_BAD_GATEWAY; break;
    case 503: type = drive_error_type::HTTP_SERVICE_UNAVAILABLE; break;
    case 504: type = drive_error_type::HTTP_GATEWAY_TIMEOUT; break;
    case 509: type = drive_error_type::HTTP_BANDWIDTH_LIMIT_EXCEEDED; break;
    default: type = drive_error_type::HTTP_UNEXPECTED_STATUS; break;
    }
    drive_error ret(type, fmt::format("HTTP status {}", static_cast<int>(http_code)), utils::http::from_http_code(http_code));
    ret._status = static_cast<int>(http_code);
    return ret;
}

drive_error drive_error::from_reply(seastar::http::reply::status_type http_code, std::string_view body) {
    auto ret = from_http_code(http_code);
    if (auto parsed = parse(body)) {
        if (parsed->_type != drive_error_type::UNKNOWN) {
            ret._type = parsed->_type;
            // a 403 only becomes worth retrying when the reason is throttling
            ret._is_retryable = parsed->_is_retryable;
        }
        if (!parsed->_message.empty()) {
            ret._message = std::move(parsed->_message);
        }
    }
    ret._status = static_cast<int>(http_code);
    return ret;
}

drive_error drive_error::from_system_error(const std::system_error& system_error) {
    drive_error ret(drive_error_type::NETWORK_CONNECTION, system_error.what(), utils::http::from_system_error(system_error));
    ret._status = status_transport_failure;
    return ret;
}

drive_exception::drive_exception(drive_error error)
    : _error(std::move(error))
    , _what(fmt::format("Drive request failed. Code: {}. Status: {}. Reason: {}", _error.get_error_type(), _error.status(), _error.get_error_message())) {
}

incomplete_upload_error::incomplete_upload_error(int last_status)
    : std::runtime_error(fmt::format("Incomplete upload - retry, last error {}", last_status))
    , _last_status(last_status) {
}

incomplete_upload_error::incomplete_upload_error(int last_status, std::string_view reason)
    : std::runtime_error(fmt::format("Incomplete upload - retry, last error {}: {}", last_status, reason))
    , _last_status(last_status) {
}

short_read_error::short_read_error(uint64_t expected, uint64_t got)
    : std::runtime_error(fmt::format("source ended early: expected {} bytes, got {}", expected, got))
    , _expected(expected)
    , _got(got) {
}

retryable classify_error(std::exception_ptr ex) {
    using namespace utils::http;
    return dispatch_exception<retryable>(
        std::move(ex),
        [](std::exception_ptr) { return retryable::no; },
        make_handler<drive_exception>([](const drive_exception& e) { return e.error().is_retryable(); }),
        make_handler<protocol_error>([](const protocol_error&) { return retryable::no; }),
        make_handler<negotiation_error>([](const negotiation_error&) { return retryable::no; }),
        make_handler<short_read_error>([](const short_read_error&) { return retryable::no; }),
        make_handler<incomplete_upload_error>([](const incomplete_upload_error&) { return retryable::no; }),
        make_handler<seastar::abort_requested_exception>([](const seastar::abort_requested_exception&) { return retryable::no; }),
        make_handler<seastar::timed_out_error>([](const seastar::timed_out_error&) { return retryable::yes; }),
        make_handler<std::system_error>([](const std::system_error& e) { return from_system_error(e); }));
}

} // namespace gdrive

auto fmt::formatter<gdrive::drive_error_type>::format(gdrive::drive_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    using enum gdrive::drive_error_type;
    std::string_view name;
    switch (type) {
    case OK: name = "OK"; break;
    case HTTP_BAD_REQUEST: name = "HTTP_BAD_REQUEST"; break;
    case HTTP_UNAUTHORIZED: name = "HTTP_UNAUTHORIZED"; break;
    case HTTP_FORBIDDEN: name = "HTTP_FORBIDDEN"; break;
    case HTTP_NOT_FOUND: name = "HTTP_NOT_FOUND"; break;
    case HTTP_REQUEST_TIMEOUT: name = "HTTP_REQUEST_TIMEOUT"; break;
    case HTTP_TOO_MANY_REQUESTS: name = "HTTP_TOO_MANY_REQUESTS"; break;
    case HTTP_INTERNAL_SERVER_ERROR: name = "HTTP_INTERNAL_SERVER_ERROR"; break;
    case HTTP_BAD_GATEWAY: name = "HTTP_BAD_GATEWAY"; break;
    case HTTP_SERVICE_UNAVAILABLE: name = "HTTP_SERVICE_UNAVAILABLE"; break;
    case HTTP_GATEWAY_TIMEOUT: name = "HTTP_GATEWAY_TIMEOUT"; break;
    case HTTP_BANDWIDTH_LIMIT_EXCEEDED: name = "HTTP_BANDWIDTH_LIMIT_EXCEEDED"; break;
    case HTTP_UNEXPECTED_STATUS: name = "HTTP_UNEXPECTED_STATUS"; break;
    case RATE_LIMIT_EXCEEDED: name = "RATE_LIMIT_EXCEEDED"; break;
    case USER_RATE_LIMIT_EXCEEDED: name = "USER_RATE_LIMIT_EXCEEDED"; break;
    case SHARING_RATE_LIMIT_EXCEEDED: name = "SHARING_RATE_LIMIT_EXCEEDED"; break;
    case BACKEND_ERROR: name = "BACKEND_ERROR"; break;
    case INTERNAL_ERROR: name = "INTERNAL_ERROR"; break;
    case NOT_FOUND: name = "NOT_FOUND"; break;
    case AUTH_ERROR: name = "AUTH_ERROR"; break;
    case INSUFFICIENT_PERMISSIONS: name = "INSUFFICIENT_PERMISSIONS"; break;
    case STORAGE_QUOTA_EXCEEDED: name = "STORAGE_QUOTA_EXCEEDED"; break;
    case UPLOAD_TOO_LARGE: name = "UPLOAD_TOO_LARGE"; break;
    case INVALID_ARGUMENT: name = "INVALID_ARGUMENT"; break;
    case NETWORK_CONNECTION: name = "NETWORK_CONNECTION"; break;
    case UNKNOWN: name = "UNKNOWN"; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}
