// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "scan/chunk.hpp"
#include "scan/table_descriptor.hpp"
#include "scan/value.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace sql_gen {

    // MySQL identifier quoting: `name`, with embedded backticks doubled.
    void write_escape_id(std::stringstream& stream, std::string_view id);
    std::string escape_id(std::string_view id);

    std::string encode_sql(const scan::value_t& value);

    // Greater-than clauses for the first columns.size() values of `row`:
    //   one column:    a>1
    //   two columns:   a>=1 AND (a,b)>(1,2)
    //   three columns: a>=1 AND (a,b,c)>(1,2,3)
    // The extra leading-column clause keeps older MySQL versions on an index range scan instead of a
    // full table scan when evaluating the row comparison.
    std::vector<std::string> greater_than_tuple_clauses(const std::vector<std::string>& columns,
                                                        const scan::row_t& row);

    // SELECT <columns> FROM <table> [WHERE <lower> AND <upper>] [ORDER BY <primary key>]
    // The lower bound is chunk.start, or the tuple predicate after resume_row once a row was delivered.
    void generate_scan_query(std::stringstream& stream,
                             const scan::table_descriptor_t& table,
                             const scan::chunk_t& chunk,
                             const std::optional<scan::row_t>& resume_row);
    std::string generate_scan_query(const scan::table_descriptor_t& table,
                                    const scan::chunk_t& chunk,
                                    const std::optional<scan::row_t>& resume_row = std::nullopt);

} // namespace sql_gen
