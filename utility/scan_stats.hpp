// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

// Counter keyed by tablet alias, safe to bump from many readers at once.
class keyed_counter_t {
public:
    void add(const std::string& key, int64_t delta = 1) {
        std::lock_guard<std::mutex> lock(m_);
        counts_[key] += delta;
    }

    int64_t get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_);
        auto it = counts_.find(key);
        return it == counts_.end() ? 0 : it->second;
    }

    int64_t total() const {
        std::lock_guard<std::mutex> lock(m_);
        int64_t sum = 0;
        for (const auto& [key, count] : counts_) {
            sum += count;
        }
        return sum;
    }

    std::map<std::string, int64_t> snapshot() const {
        std::lock_guard<std::mutex> lock(m_);
        return counts_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(m_);
        counts_.clear();
    }

private:
    mutable std::mutex m_;
    std::map<std::string, int64_t> counts_;
};

struct scan_stats_t {
    // extra connect/stream attempts, both at construction and while restarting a stream
    std::atomic<int64_t> retry_count{0};
    keyed_counter_t streaming_query_started;
    keyed_counter_t streaming_query_errors;
    keyed_counter_t restarts_same_tablet;
    std::atomic<int64_t> restarts_different_tablet{0};

    void reset() {
        retry_count = 0;
        streaming_query_started.reset();
        streaming_query_errors.reset();
        restarts_same_tablet.reset();
        restarts_different_tablet = 0;
    }
};

inline scan_stats_t& scan_stats() {
    static scan_stats_t stats;
    return stats;
}
