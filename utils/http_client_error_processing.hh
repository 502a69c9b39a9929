/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>
#include <exception>
#include <optional>
#include <system_error>
#include <type_traits>
#include <vector>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// Request timeouts, throttling and the 5xx family the service documents as transient.
retryable from_http_code(seastar::http::reply::status_type http_code);

// Connection-level failures (reset, refused, unreachable, timed out).
retryable from_system_error(const std::system_error& system_error);

// The levels of a std::throw_with_nested chain, outermost first. The walk
// stops at the first level that is not a std::exception.
std::vector<std::exception_ptr> nested_exception_chain(std::exception_ptr eptr);

// A handler for exceptions of type Exc: yields f's result when the exception
// is an Exc and nothing otherwise.
template <typename Exc, typename F>
auto make_handler(F&& f) {
    static_assert(std::is_base_of_v<std::exception, Exc>, "only std::exception types can be handled");
    using result_type = std::invoke_result_t<F, const Exc&>;
    return [f = std::forward<F>(f)] (const std::exception& e) -> std::optional<result_type> {
        if (auto* exc = dynamic_cast<const Exc*>(&e)) {
            return f(*exc);
        }
        return std::nullopt;
    };
}

// Offers each level of the nested chain to the handlers in turn and returns
// the first answer. default_handler gets the original exception when nobody
// answers.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    static_assert(std::is_same_v<R, std::invoke_result_t<DefaultHandler, std::exception_ptr>>, "Default handler must return R");

    for (const auto& level : nested_exception_chain(eptr)) {
        std::optional<R> result;
        try {
            std::rethrow_exception(level);
        } catch (const std::exception& e) {
            auto offer = [&] (auto& handler) {
                if (!result) {
                    result = handler(e);
                }
            };
            (offer(handlers), ...);
        }
        if (result) {
            return std::move(*result);
        }
    }
    return default_handler(std::move(eptr));
}

} // namespace utils::http
