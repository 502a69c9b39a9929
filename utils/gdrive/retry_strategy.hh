/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <cstdint>

#include "utils/gdrive/drive_error.hh"

namespace gdrive {

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns yes if a call that failed with the given classification may be attempted again after attempted_retries retries.
    [[nodiscard]] virtual retryable should_retry(retryable error_class, uint32_t attempted_retries) const = 0;

    // How long to sleep before retry number attempted_retries.
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(uint32_t attempted_retries) const = 0;

    [[nodiscard]] virtual uint32_t get_max_retries() const = 0;
};

// Exponential backoff: nothing before the first retry, then scale * 2^n,
// never more than max_delay.
class default_retry_strategy : public retry_strategy {
    uint32_t _max_retries;
    std::chrono::milliseconds _scale_factor;
    std::chrono::milliseconds _max_delay;

public:
    explicit default_retry_strategy(uint32_t max_retries = 10,
                                    std::chrono::milliseconds scale_factor = std::chrono::milliseconds(100),
                                    std::chrono::milliseconds max_delay = std::chrono::milliseconds(2000));

    [[nodiscard]] retryable should_retry(retryable error_class, uint32_t attempted_retries) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(uint32_t attempted_retries) const override;

    [[nodiscard]] uint32_t get_max_retries() const override { return _max_retries; }
};

} // namespace gdrive
