/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <exception>
#include <fmt/core.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <seastar/http/reply.hh>

#include "utils/http_client_error_processing.hh"

namespace gdrive {

using retryable = utils::http::retryable;

// A response that carries no status at all (connection dropped, reset, timed out).
static constexpr int status_transport_failure = 599;

enum class drive_error_type : uint8_t {
    OK = 0,
    // Classified by HTTP status only
    HTTP_BAD_REQUEST,
    HTTP_UNAUTHORIZED,
    HTTP_FORBIDDEN,
    HTTP_NOT_FOUND,
    HTTP_REQUEST_TIMEOUT,
    HTTP_TOO_MANY_REQUESTS,
    HTTP_INTERNAL_SERVER_ERROR,
    HTTP_BAD_GATEWAY,
    HTTP_SERVICE_UNAVAILABLE,
    HTTP_GATEWAY_TIMEOUT,
    HTTP_BANDWIDTH_LIMIT_EXCEEDED,
    HTTP_UNEXPECTED_STATUS,
    // Reasons reported in the service's error document
    RATE_LIMIT_EXCEEDED,
    USER_RATE_LIMIT_EXCEEDED,
    SHARING_RATE_LIMIT_EXCEEDED,
    BACKEND_ERROR,
    INTERNAL_ERROR,
    NOT_FOUND,
    AUTH_ERROR,
    INSUFFICIENT_PERMISSIONS,
    STORAGE_QUOTA_EXCEEDED,
    UPLOAD_TOO_LARGE,
    INVALID_ARGUMENT,
    // Transport
    NETWORK_CONNECTION,
    UNKNOWN,
};

class drive_error {
    drive_error_type _type = drive_error_type::OK;
    std::string _message;
    retryable _is_retryable = retryable::no;
    int _status = 0;

public:
    drive_error() = default;
    drive_error(drive_error_type error_type, retryable is_retryable);
    drive_error(drive_error_type error_type, std::string message, retryable is_retryable);

    [[nodiscard]] drive_error_type get_error_type() const noexcept { return _type; }
    [[nodiscard]] const std::string& get_error_message() const noexcept { return _message; }
    [[nodiscard]] retryable is_retryable() const noexcept { return _is_retryable; }
    // HTTP status the error came with, or status_transport_failure, or 0 when unknown.
    [[nodiscard]] int status() const noexcept { return _status; }

    // Reads the {"error": {"code": ..., "message": ..., "errors": [{"reason": ...}]}}
    // document the service attaches to failed calls.
    static std::optional<drive_error> parse(std::string_view body);
    static drive_error from_http_code(seastar::http::reply::status_type http_code);
    // Status first, refined by the reason in the body when the service gave a known one.
    static drive_error from_reply(seastar::http::reply::status_type http_code, std::string_view body);
    static drive_error from_system_error(const std::system_error& system_error);
};

using drive_errors = std::unordered_map<std::string_view, const drive_error>;
extern const drive_errors drive_error_map;

class drive_exception : public std::exception {
    drive_error _error;
    std::string _what;

public:
    explicit drive_exception(drive_error error);

    const char* what() const noexcept override { return _what.c_str(); }
    const drive_error& error() const noexcept { return _error; }
};

// The negotiation reply did not give a usable session URI.
class negotiation_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The service answered something the protocol does not allow for (bad Range
// header, undecodable completion body).
class protocol_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The transfer loop ended without the service confirming the object. Nothing
// short of negotiating a new session and sending everything again can fix it.
class incomplete_upload_error : public std::runtime_error {
    int _last_status;

public:
    explicit incomplete_upload_error(int last_status);
    incomplete_upload_error(int last_status, std::string_view reason);

    int last_status() const noexcept { return _last_status; }
};

// The source ran dry before the size announced to the service was reached.
class short_read_error : public std::runtime_error {
    uint64_t _expected;
    uint64_t _got;

public:
    short_read_error(uint64_t expected, uint64_t got);

    uint64_t expected() const noexcept { return _expected; }
    uint64_t got() const noexcept { return _got; }
};

// Default retry predicate for everything the uploader sends.
retryable classify_error(std::exception_ptr ex);

} // namespace gdrive

template <>
struct fmt::formatter<gdrive::drive_error_type> : fmt::formatter<std::string_view> {
    auto format(gdrive::drive_error_type, fmt::format_context& ctx) const -> decltype(ctx.out());
};
