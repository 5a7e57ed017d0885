// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "connectors/tablet_provider.hpp"
#include "utility/logger.hpp"
#include "utility/thread_pool_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace fanout {

    struct shard_target {
        std::string name;
        std::shared_ptr<tablet::ITabletProvider> provider;
    };

    template<typename Response>
    struct fanout_output {
        std::map<std::string, Response> responses;
        // first failure in completion order; the other shards still ran to the end
        std::exception_ptr first_error;
        std::string first_error_shard;

        bool ok() const noexcept { return first_error == nullptr; }

        void rethrow_if_failed() const {
            if (first_error) {
                std::rethrow_exception(first_error);
            }
        }
    };

    // Runs job(shard) for every shard in parallel and collects the responses by shard name.
    // pool_size 0 means one thread per shard, capped by the hardware concurrency.
    template<typename Job>
    auto for_all_shards(const std::vector<shard_target>& shards, Job job, std::size_t pool_size = 0)
        -> fanout_output<std::invoke_result_t<Job&, const shard_target&>> {
        using response_t = std::invoke_result_t<Job&, const shard_target&>;

        std::set<std::string> names;
        for (const auto& shard : shards) {
            if (!names.insert(shard.name).second) {
                throw std::invalid_argument("shard " + shard.name + " is listed more than once");
            }
        }

        fanout_output<response_t> output;
        if (shards.empty()) {
            return output;
        }

        auto log = get_logger(logger_tag::SHARD_FANOUT);
        if (pool_size == 0) {
            pool_size = std::min<std::size_t>(shards.size(),
                                               std::max<unsigned>(std::thread::hardware_concurrency(), 1));
        }

        std::mutex m;
        auto record_error = [&](const shard_target& shard, std::exception_ptr error, const std::string& what) {
            log->error("shard {}: {}", shard.name, what);
            std::lock_guard<std::mutex> lock(m);
            if (!output.first_error) {
                output.first_error = std::move(error);
                output.first_error_shard = shard.name;
            }
        };

        thread_pool_manager pool(pool_size);
        pool.start();
        std::vector<std::future<void>> pending;
        pending.reserve(shards.size());
        for (const auto& shard : shards) {
            pending.push_back(pool.submit([&]() {
                log->debug("shard {}: job started", shard.name);
                try {
                    auto response = job(shard);
                    std::lock_guard<std::mutex> lock(m);
                    output.responses.emplace(shard.name, std::move(response));
                } catch (const std::exception& e) {
                    record_error(shard, std::current_exception(), e.what());
                } catch (...) {
                    record_error(shard, std::current_exception(), "unknown error");
                }
            }));
        }
        for (auto& done : pending) {
            done.get();
        }
        pool.stop();

        log->debug("{} of {} shards finished without error", output.responses.size(), shards.size());
        return output;
    }

} // namespace fanout
