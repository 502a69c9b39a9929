/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "pacer.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/log.hh"

using namespace seastar;

namespace gdrive {

static logging::logger pacer_log("gdrive_pacer");

backoff_pacer::backoff_pacer(std::unique_ptr<retry_strategy> strategy, unsigned max_concurrent_calls)
    : _retry_strategy(std::move(strategy))
    , _concurrency(max_concurrent_calls) {
}

future<> backoff_pacer::call(noncopyable_function<future<>()> fn, const error_classifier& classify, abort_source* as) {
    // get_units() and sleep_abortable() won't notice an abort requested
    // before they register, so check on entry.
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    uint32_t retries = 0;
    while (true) {
        std::exception_ptr e;
        {
            auto units = co_await (as ? get_units(_concurrency, 1, *as) : get_units(_concurrency, 1));
            ++_calls;
            try {
                co_await fn();
                co_return;
            } catch (...) {
                e = std::current_exception();
            }
        }

        auto error_class = classify(e);
        if (!_retry_strategy->should_retry(error_class, retries)) {
            if (error_class) {
                pacer_log.debug("giving up after {} retries: {}", retries, e);
            }
            co_await coroutine::return_exception_ptr(std::move(e));
        }
        auto delay = _retry_strategy->delay_before_retry(retries);
        pacer_log.debug("retry {}/{} in {}ms: {}", retries + 1, _retry_strategy->get_max_retries(), delay.count(), e);
        ++retries;
        ++_retries;
        if (as) {
            co_await sleep_abortable(delay, *as);
        } else {
            co_await sleep(delay);
        }
    }
}

} // namespace gdrive
