/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"

#include <cerrno>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    switch (static_cast<int>(http_code)) {
    case 408: // request timeout
    case 429: // too many requests
    case 500:
    case 502:
    case 503:
    case 504:
    case 509: // bandwidth limit exceeded
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() != std::system_category() && system_error.code().category() != std::generic_category()) {
        return retryable::no;
    }
    switch (system_error.code().value()) {
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case EPIPE:
    case ETIMEDOUT:
    case ENETUNREACH:
    case EHOSTUNREACH:
    case ENOTCONN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

std::vector<std::exception_ptr> nested_exception_chain(std::exception_ptr eptr) {
    std::vector<std::exception_ptr> chain;
    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            chain.push_back(eptr);
            auto nested = dynamic_cast<const std::nested_exception*>(&e);
            eptr = nested ? nested->nested_ptr() : nullptr;
        } catch (...) {
            break;
        }
    }
    return chain;
}

} // namespace utils::http
