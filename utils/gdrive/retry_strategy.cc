/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retry_strategy.hh"

#include <algorithm>

using namespace std::chrono_literals;

namespace gdrive {

default_retry_strategy::default_retry_strategy(uint32_t max_retries, std::chrono::milliseconds scale_factor, std::chrono::milliseconds max_delay)
    : _max_retries(max_retries)
    , _scale_factor(scale_factor)
    , _max_delay(max_delay) {
}

retryable default_retry_strategy::should_retry(retryable error_class, uint32_t attempted_retries) const {
    if (attempted_retries >= _max_retries) {
        return retryable::no;
    }

    return error_class;
}

std::chrono::milliseconds default_retry_strategy::delay_before_retry(uint32_t attempted_retries) const {
    if (attempted_retries == 0) {
        return 0ms;
    }
    // past this the shift alone would overflow
    if (attempted_retries >= 31) {
        return _max_delay;
    }
    return std::min(std::chrono::milliseconds((1UL << attempted_retries) * _scale_factor.count()), _max_delay);
}

} // namespace gdrive
