/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/util/noncopyable_function.hh>

#include "utils/gdrive/retry_strategy.hh"

namespace gdrive {

// Decides whether a failed call is worth repeating.
using error_classifier = seastar::noncopyable_function<retryable(std::exception_ptr)>;

// Runs calls against the service, repeating the ones that fail in a way the
// classifier considers transient. The last failure is rethrown when the call
// is not retryable or the retry budget is spent.
class pacer {
public:
    virtual ~pacer() = default;

    virtual seastar::future<> call(seastar::noncopyable_function<seastar::future<>()> fn, const error_classifier& classify, seastar::abort_source* as = nullptr) = 0;

    uint64_t calls() const noexcept { return _calls; }
    uint64_t retries() const noexcept { return _retries; }

protected:
    uint64_t _calls = 0;
    uint64_t _retries = 0;
};

// Bounds the number of calls in flight and sleeps with exponential backoff
// between attempts.
class backoff_pacer : public pacer {
    std::unique_ptr<retry_strategy> _retry_strategy;
    seastar::semaphore _concurrency;

public:
    backoff_pacer(std::unique_ptr<retry_strategy> strategy, unsigned max_concurrent_calls);

    seastar::future<> call(seastar::noncopyable_function<seastar::future<>()> fn, const error_classifier& classify, seastar::abort_source* as = nullptr) override;

    const retry_strategy& strategy() const noexcept { return *_retry_strategy; }
};

} // namespace gdrive
