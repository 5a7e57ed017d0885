// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace scan {

    // Columns are ordered primary-key first; the query generator and resume logic rely on
    // row[i] being the value of primary_key_columns[i].
    struct table_descriptor_t {
        std::string name;
        std::vector<std::string> columns;
        std::vector<std::string> primary_key_columns;
    };

    using table_descriptor_ptr = std::shared_ptr<const table_descriptor_t>;

    // Returns `columns` with the primary-key columns moved to the front in key order; the other
    // columns keep their relative order. Throws std::invalid_argument when a key column is missing.
    std::vector<std::string> reorder_columns_primary_key_first(const std::vector<std::string>& columns,
                                                               const std::vector<std::string>& primary_key_columns);

    void validate(const table_descriptor_t& table);

    table_descriptor_ptr make_table_descriptor(std::string name,
                                               const std::vector<std::string>& columns,
                                               std::vector<std::string> primary_key_columns);

} // namespace scan
