// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "value.hpp"

#include <string>

namespace scan {

    // Half-open range [start, end) on the first primary-key column. A NULL bound is unbounded.
    struct chunk_t {
        value_t start;
        value_t end;

        std::string to_string() const {
            auto bound = [](const value_t& v, const char* unbounded) {
                if (v.is_null()) {
                    return std::string(unbounded);
                }
                return v.kind() == value_kind::DOUBLE ? v.to_string() : v.to_sql();
            };
            return "[" + bound(start, "-inf") + "," + bound(end, "+inf") + ")";
        }
    };

} // namespace scan
