// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include <cstddef>
#include <functional>

template<typename T, typename... Rest>
void hash_combine(std::size_t& seed, const T& v, const Rest&... rest) {
    seed ^= std::hash<T>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    (hash_combine(seed, rest), ...);
}

// Order-sensitive: folding the same hashes in a different order gives a different result.
inline void hash_fold(std::size_t& seed, std::size_t value) { hash_combine(seed, value); }
