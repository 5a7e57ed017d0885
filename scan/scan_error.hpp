// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scan {

    // TRANSIENT is only raised below the reader, which retries it.
    enum class error_kind : uint8_t
    {
        TRANSIENT,
        FATAL,
        BUDGET_EXHAUSTED,
        DEADLINE_EXCEEDED,
        CANCELLED,
        INIT_FAILED,
    };

    constexpr std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::TRANSIENT:
                return "transient";
            case error_kind::FATAL:
                return "fatal";
            case error_kind::BUDGET_EXHAUSTED:
                return "budget exhausted";
            case error_kind::DEADLINE_EXCEEDED:
                return "deadline exceeded";
            case error_kind::CANCELLED:
                return "cancelled";
            case error_kind::INIT_FAILED:
                return "init failed";
        }
        return "unknown";
    }

    class scan_error : public std::runtime_error {
    public:
        scan_error(error_kind kind, const std::string& what)
            : std::runtime_error(what)
            , kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

    private:
        error_kind kind_;
    };

} // namespace scan
