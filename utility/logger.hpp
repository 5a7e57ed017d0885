// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view RESUMABLE_READER = "ResumableReader";
    inline constexpr std::string_view STREAM_SESSION = "StreamSession";
    inline constexpr std::string_view TABLET_CONNECTOR = "TabletConnector";
    inline constexpr std::string_view TABLET_PROVIDER = "TabletProvider";
    inline constexpr std::string_view SHARD_FANOUT = "ShardFanout";
} // namespace logger_tag

namespace logger_impl {
    inline std::mutex& registry_mutex() {
        static std::mutex m;
        return m;
    }

    inline log_t make_logger(std::string name, std::vector<spdlog::sink_ptr> sinks) {
        auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        return logger;
    }
} // namespace logger_impl

// Loggers are created on first use with a stdout sink, so components work before (or without)
// initialize_all_loggers(). Readers run on fan-out worker threads, hence the registry lock.
inline log_t get_logger(std::string_view tag) {
    std::lock_guard<std::mutex> lock(logger_impl::registry_mutex());
    if (auto log_ptr = spdlog::get(std::string(tag)); log_ptr) {
        return log_ptr;
    }
    return logger_impl::make_logger(std::string(tag), {std::make_shared<spdlog::sinks::stdout_color_sink_mt>()});
}

// we need a named logger with a file sink per component, not the default one.
// A logger already handed out by get_logger() keeps its identity and gains the file sink; the sink
// list of spdlog::logger is not synchronized, so call this before other threads start logging.
inline log_t initialize_logger(std::string name, std::string prefix) {
    std::lock_guard<std::mutex> lock(logger_impl::registry_mutex());

    std::filesystem::create_directories(prefix);
    if (prefix.back() != '/') {
        prefix += '/';
    }

    using namespace std::chrono;
    auto since_epoch = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    auto file_name = fmt::format("{}{}-{}.txt", prefix, name, since_epoch);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true);
    spdlog::flush_every(std::chrono::seconds(1));

    if (auto log_ptr = spdlog::get(name); log_ptr) {
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v");
        log_ptr->sinks().push_back(std::move(file_sink));
        return log_ptr;
    }

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    return logger_impl::make_logger(std::move(name), {stdout_sink, file_sink});
}

inline void initialize_all_loggers(const std::string& prefix) {
    static constexpr std::array<std::string_view, 5> all_loggers = {
        logger_tag::RESUMABLE_READER,
        logger_tag::STREAM_SESSION,
        logger_tag::TABLET_CONNECTOR,
        logger_tag::TABLET_PROVIDER,
        logger_tag::SHARD_FANOUT,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix);
    }
}
