// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "value.hpp"

#include "utility/hash_combine.hpp"

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>

namespace scan {

    namespace {
        // Rank of the comparison category; numbers share one rank, strings and bytes share another.
        int category(value_kind kind) {
            switch (kind) {
                case value_kind::NA:
                    return 0;
                case value_kind::INT64:
                case value_kind::UINT64:
                case value_kind::DOUBLE:
                    return 1;
                case value_kind::STRING:
                case value_kind::BYTES:
                    return 2;
            }
            return 3;
        }

        template<typename T>
        int three_way(const T& lhs, const T& rhs) {
            if (lhs < rhs) {
                return -1;
            }
            return rhs < lhs ? 1 : 0;
        }

        int compare_signed_unsigned(int64_t lhs, uint64_t rhs) {
            if (lhs < 0) {
                return -1;
            }
            return three_way(static_cast<uint64_t>(lhs), rhs);
        }

        void escape_string(std::string& out, std::string_view str) {
            out.push_back('\'');
            for (char c : str) {
                switch (c) {
                    case '\0':
                        out += "\\0";
                        break;
                    case '\'':
                        out += "\\'";
                        break;
                    case '"':
                        out += "\\\"";
                        break;
                    case '\b':
                        out += "\\b";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\x1a':
                        out += "\\Z";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    default:
                        out.push_back(c);
                }
            }
            out.push_back('\'');
        }
    } // namespace

    value_t value_t::bytes(std::string raw) {
        value_t result;
        result.data_ = bytes_t{std::move(raw)};
        return result;
    }

    value_kind value_t::kind() const noexcept {
        switch (data_.index()) {
            case 1:
                return value_kind::INT64;
            case 2:
                return value_kind::UINT64;
            case 3:
                return value_kind::DOUBLE;
            case 4:
                return value_kind::STRING;
            case 5:
                return value_kind::BYTES;
            default:
                return value_kind::NA;
        }
    }

    int64_t value_t::as_int64() const {
        if (auto* v = std::get_if<int64_t>(&data_)) {
            return *v;
        }
        throw std::logic_error("value is not a signed integer: " + to_string());
    }

    uint64_t value_t::as_uint64() const {
        if (auto* v = std::get_if<uint64_t>(&data_)) {
            return *v;
        }
        throw std::logic_error("value is not an unsigned integer: " + to_string());
    }

    double value_t::as_double() const {
        switch (kind()) {
            case value_kind::DOUBLE:
                return std::get<double>(data_);
            case value_kind::INT64:
                return static_cast<double>(std::get<int64_t>(data_));
            case value_kind::UINT64:
                return static_cast<double>(std::get<uint64_t>(data_));
            default:
                throw std::logic_error("value is not numeric: " + to_string());
        }
    }

    const std::string& value_t::as_string() const {
        if (auto* v = std::get_if<std::string>(&data_)) {
            return *v;
        }
        if (auto* v = std::get_if<bytes_t>(&data_)) {
            return v->data;
        }
        throw std::logic_error("value is not a string: " + to_string());
    }

    void value_t::encode_sql(std::string& out) const {
        switch (kind()) {
            case value_kind::NA:
                out += "NULL";
                break;
            case value_kind::INT64:
                out += fmt::format("{}", std::get<int64_t>(data_));
                break;
            case value_kind::UINT64:
                out += fmt::format("{}", std::get<uint64_t>(data_));
                break;
            case value_kind::DOUBLE: {
                const auto d = std::get<double>(data_);
                if (!std::isfinite(d)) {
                    throw std::invalid_argument(fmt::format("{} has no SQL literal", d));
                }
                // shortest representation that reads back to the same double
                out += fmt::format("{}", d);
                break;
            }
            case value_kind::STRING:
                escape_string(out, std::get<std::string>(data_));
                break;
            case value_kind::BYTES: {
                static constexpr char hex[] = "0123456789ABCDEF";
                out += "X'";
                for (unsigned char c : std::get<bytes_t>(data_).data) {
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
                out.push_back('\'');
                break;
            }
        }
    }

    std::string value_t::to_sql() const {
        std::string out;
        encode_sql(out);
        return out;
    }

    std::string value_t::to_string() const {
        if (kind() == value_kind::STRING) {
            return std::get<std::string>(data_);
        }
        if (kind() == value_kind::DOUBLE) {
            return fmt::format("{}", std::get<double>(data_));
        }
        return to_sql();
    }

    int compare(const value_t& lhs, const value_t& rhs) {
        const auto lkind = lhs.kind();
        const auto rkind = rhs.kind();
        if (int c = three_way(category(lkind), category(rkind)); c != 0) {
            return c;
        }

        switch (category(lkind)) {
            case 0:
                return 0;
            case 2:
                // std::char_traits<char>::compare orders as unsigned char
                return three_way(lhs.as_string().compare(rhs.as_string()), 0);
            default:
                break;
        }

        if (lkind == value_kind::DOUBLE || rkind == value_kind::DOUBLE) {
            return three_way(lhs.as_double(), rhs.as_double());
        }
        if (lkind == value_kind::INT64 && rkind == value_kind::INT64) {
            return three_way(lhs.as_int64(), rhs.as_int64());
        }
        if (lkind == value_kind::UINT64 && rkind == value_kind::UINT64) {
            return three_way(lhs.as_uint64(), rhs.as_uint64());
        }
        if (lkind == value_kind::INT64) {
            return compare_signed_unsigned(lhs.as_int64(), rhs.as_uint64());
        }
        return -compare_signed_unsigned(rhs.as_int64(), lhs.as_uint64());
    }

    // Values that compare equal hash equal: numbers hash by their integral value whatever their kind,
    // strings and bytes hash by content. Integers beyond 2^53 compared with a double are the exception.
    std::size_t hash_value(const value_t& value) {
        std::size_t seed = static_cast<std::size_t>(category(value.kind()));
        switch (value.kind()) {
            case value_kind::NA:
                break;
            case value_kind::INT64:
                hash_combine(seed, value.as_int64());
                break;
            case value_kind::UINT64:
                if (auto u = value.as_uint64(); u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    hash_combine(seed, static_cast<int64_t>(u));
                } else {
                    hash_combine(seed, u);
                }
                break;
            case value_kind::DOUBLE: {
                // 2^63 and 2^64 are exact doubles
                constexpr double two_63 = 9223372036854775808.0;
                const auto d = value.as_double();
                if (std::isfinite(d) && std::trunc(d) == d && d >= -two_63 && d < two_63) {
                    hash_combine(seed, static_cast<int64_t>(d));
                } else if (std::isfinite(d) && std::trunc(d) == d && d >= 0 && d < 2 * two_63) {
                    hash_combine(seed, static_cast<uint64_t>(d));
                } else {
                    hash_combine(seed, d);
                }
                break;
            }
            case value_kind::STRING:
            case value_kind::BYTES:
                hash_combine(seed, std::string_view(value.as_string()));
                break;
        }
        return seed;
    }

    std::string to_string(const row_t& row) {
        std::string out = "(";
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i != 0) {
                out += ",";
            }
            out += row[i].kind() == value_kind::DOUBLE ? row[i].to_string() : row[i].to_sql();
        }
        out += ")";
        return out;
    }

    bool tuple_greater(const row_t& lhs, const row_t& rhs, std::size_t n) {
        if (lhs.size() < n || rhs.size() < n) {
            throw std::invalid_argument(
                fmt::format("tuple comparison over {} columns with rows of size {} and {}", n, lhs.size(), rhs.size()));
        }
        for (std::size_t i = 0; i < n; ++i) {
            int c = compare(lhs[i], rhs[i]);
            if (c != 0) {
                return c > 0;
            }
        }
        return false;
    }

} // namespace scan
