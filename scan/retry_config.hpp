// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <chrono>

namespace scan {

    inline constexpr std::chrono::milliseconds DEFAULT_RETRY_BUDGET = std::chrono::hours(2);
    inline constexpr std::chrono::milliseconds DEFAULT_BACKOFF_INTERVAL = std::chrono::seconds(30);

    struct retry_config {
        // max wall-clock time spent restarting one interrupted stream
        std::chrono::milliseconds retry_budget = DEFAULT_RETRY_BUDGET;
        // fixed pause between two restart attempts
        std::chrono::milliseconds backoff_interval = DEFAULT_BACKOFF_INTERVAL;
    };

} // namespace scan
