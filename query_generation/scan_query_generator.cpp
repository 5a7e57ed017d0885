// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "scan_query_generator.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace {

    void write_id_list(std::stringstream& stream, const std::vector<std::string>& ids) {
        bool separator = false;
        for (const auto& id : ids) {
            if (separator) {
                stream << ",";
            }
            sql_gen::write_escape_id(stream, id);
            separator = true;
        }
    }

    std::string bound_clause(const std::string& column, std::string_view op, const scan::value_t& bound) {
        std::stringstream stream;
        sql_gen::write_escape_id(stream, column);
        stream << op << sql_gen::encode_sql(bound);
        return stream.str();
    }

} // namespace

namespace sql_gen {

    void write_escape_id(std::stringstream& stream, std::string_view id) {
        stream << '`';
        for (char c : id) {
            if (c == '`') {
                stream << '`';
            }
            stream << c;
        }
        stream << '`';
    }

    std::string escape_id(std::string_view id) {
        std::stringstream stream;
        write_escape_id(stream, id);
        return stream.str();
    }

    std::string encode_sql(const scan::value_t& value) { return value.to_sql(); }

    std::vector<std::string> greater_than_tuple_clauses(const std::vector<std::string>& columns,
                                                        const scan::row_t& row) {
        if (columns.empty()) {
            throw std::invalid_argument("greater-than tuple clause needs at least one column");
        }
        if (row.size() < columns.size()) {
            throw std::invalid_argument(
                fmt::format("resume row has {} values for {} key columns", row.size(), columns.size()));
        }

        std::vector<std::string> clauses;
        const bool multi_column = columns.size() > 1;
        if (multi_column) {
            clauses.push_back(bound_clause(columns.front(), ">=", row.front()));
        }

        std::stringstream stream;
        if (multi_column) {
            stream << "(";
        }
        write_id_list(stream, columns);
        if (multi_column) {
            stream << ")";
        }

        stream << ">";

        if (multi_column) {
            stream << "(";
        }
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (i != 0) {
                stream << ",";
            }
            stream << encode_sql(row[i]);
        }
        if (multi_column) {
            stream << ")";
        }
        clauses.push_back(stream.str());
        return clauses;
    }

    void generate_scan_query(std::stringstream& stream,
                             const scan::table_descriptor_t& table,
                             const scan::chunk_t& chunk,
                             const std::optional<scan::row_t>& resume_row) {
        const auto& keys = table.primary_key_columns;
        if (keys.empty() && (resume_row || !chunk.start.is_null() || !chunk.end.is_null())) {
            throw std::invalid_argument(
                fmt::format("table '{}' has no primary key, a bounded or resumed scan is impossible", table.name));
        }

        stream << "SELECT ";
        write_id_list(stream, table.columns);
        stream << " FROM ";
        write_escape_id(stream, table.name);

        std::vector<std::string> clauses;
        if (!resume_row) {
            if (!chunk.start.is_null()) {
                clauses.push_back(bound_clause(keys.front(), ">=", chunk.start));
            }
        } else {
            // Restart: read after the last delivered row. The new lower bound cannot pass `end`
            // because every delivered row already satisfied the `< end` clause.
            auto resume = greater_than_tuple_clauses(keys, *resume_row);
            clauses.insert(clauses.end(), resume.begin(), resume.end());
        }
        if (!chunk.end.is_null()) {
            clauses.push_back(bound_clause(keys.front(), "<", chunk.end));
        }

        if (!clauses.empty()) {
            stream << " WHERE ";
            bool separator = false;
            for (const auto& clause : clauses) {
                if (separator) {
                    stream << " AND ";
                }
                stream << clause;
                separator = true;
            }
        }
        if (!keys.empty()) {
            stream << " ORDER BY ";
            write_id_list(stream, keys);
        }
    }

    std::string generate_scan_query(const scan::table_descriptor_t& table,
                                    const scan::chunk_t& chunk,
                                    const std::optional<scan::row_t>& resume_row) {
        std::stringstream stream;
        generate_scan_query(stream, table, chunk, resume_row);
        return stream.str();
    }

} // namespace sql_gen
