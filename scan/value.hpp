// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scan {

    enum class value_kind : uint8_t
    {
        NA,
        INT64,
        UINT64,
        DOUBLE,
        STRING,
        BYTES,
    };

    // Nullable scalar as it arrives from a tablet.
    // Ordering: NULL first, numbers by numeric value across kinds, then strings and bytes as unsigned
    // byte sequences (binary collation).
    class value_t {
    public:
        value_t() = default;
        value_t(std::nullptr_t) {}

        template<std::integral T>
        requires(!std::same_as<T, bool>) value_t(T v) {
            if constexpr (std::is_signed_v<T>) {
                data_ = static_cast<int64_t>(v);
            } else {
                data_ = static_cast<uint64_t>(v);
            }
        }
        value_t(double v)
            : data_{v} {}
        value_t(std::string v)
            : data_{std::move(v)} {}
        value_t(std::string_view v)
            : data_{std::string(v)} {}
        value_t(const char* v)
            : data_{std::string(v)} {}

        static value_t bytes(std::string raw);

        value_kind kind() const noexcept;
        bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }

        int64_t as_int64() const;
        uint64_t as_uint64() const;
        double as_double() const;
        const std::string& as_string() const;

        // Appends the value as an ordering-preserving SQL literal.
        void encode_sql(std::string& out) const;
        std::string to_sql() const;

        // Unquoted rendering for log lines.
        std::string to_string() const;

        friend int compare(const value_t& lhs, const value_t& rhs);
        friend std::strong_ordering operator<=>(const value_t& lhs, const value_t& rhs) {
            return compare(lhs, rhs) <=> 0;
        }
        friend bool operator==(const value_t& lhs, const value_t& rhs) { return compare(lhs, rhs) == 0; }

    private:
        struct bytes_t {
            std::string data;
        };

        std::variant<std::monostate, int64_t, uint64_t, double, std::string, bytes_t> data_;
    };

    int compare(const value_t& lhs, const value_t& rhs);

    std::size_t hash_value(const value_t& value);

    using row_t = std::vector<value_t>;

    std::string to_string(const row_t& row);

    // Lexicographic (lhs[0..n) > rhs[0..n)), the in-memory counterpart of the SQL row comparison
    // (a,b) > (x,y)  <=>  a > x OR (a = x AND b > y).
    bool tuple_greater(const row_t& lhs, const row_t& rhs, std::size_t n);

} // namespace scan
