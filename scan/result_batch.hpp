// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "value.hpp"

#include <string>
#include <vector>

namespace scan {

    struct field_t {
        std::string name;
        std::string type;
    };

    // One response of a streaming query. Only the first response of a stream carries fields.
    struct result_batch_t {
        std::vector<field_t> fields;
        std::vector<row_t> rows;
    };

} // namespace scan
