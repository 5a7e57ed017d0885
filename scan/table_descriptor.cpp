// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "table_descriptor.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace scan {

    std::vector<std::string> reorder_columns_primary_key_first(const std::vector<std::string>& columns,
                                                               const std::vector<std::string>& primary_key_columns) {
        std::unordered_set<std::string> key_set;
        std::vector<std::string> result;
        result.reserve(columns.size());

        for (const auto& key : primary_key_columns) {
            if (std::find(columns.begin(), columns.end(), key) == columns.end()) {
                throw std::invalid_argument(fmt::format("primary key column '{}' is not in the column list", key));
            }
            if (!key_set.insert(key).second) {
                throw std::invalid_argument(fmt::format("primary key column '{}' is listed twice", key));
            }
            result.push_back(key);
        }
        for (const auto& column : columns) {
            if (!key_set.contains(column)) {
                result.push_back(column);
            }
        }
        return result;
    }

    void validate(const table_descriptor_t& table) {
        if (table.name.empty()) {
            throw std::invalid_argument("table name is empty");
        }
        if (table.columns.empty()) {
            throw std::invalid_argument(fmt::format("table '{}' has no columns", table.name));
        }
        if (table.primary_key_columns.size() > table.columns.size() ||
            !std::equal(table.primary_key_columns.begin(), table.primary_key_columns.end(), table.columns.begin())) {
            throw std::invalid_argument(
                fmt::format("table '{}': primary key columns must lead the column list", table.name));
        }
    }

    table_descriptor_ptr make_table_descriptor(std::string name,
                                               const std::vector<std::string>& columns,
                                               std::vector<std::string> primary_key_columns) {
        auto table = std::make_shared<table_descriptor_t>();
        table->name = std::move(name);
        table->columns = reorder_columns_primary_key_first(columns, primary_key_columns);
        table->primary_key_columns = std::move(primary_key_columns);
        validate(*table);
        return table;
    }

} // namespace scan
