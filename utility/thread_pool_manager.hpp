// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <cstddef>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

enum class thread_pool_status
{
    CREATED,
    RUNNING,
    STOPPED
};

// Fixed set of threads running one io_context. Jobs are posted to it and report through futures.
class thread_pool_manager {
public:
    explicit thread_pool_manager(std::size_t pool_size = std::thread::hardware_concurrency())
        : pool_size_{std::max<std::size_t>(pool_size, 1)}
        , pool_status_{thread_pool_status::CREATED}
        , work_guard_(boost::asio::make_work_guard(ctx_)) {}

    thread_pool_manager(const thread_pool_manager&) = delete;
    thread_pool_manager& operator=(const thread_pool_manager&) = delete;

    ~thread_pool_manager() { stop(); }

    boost::asio::io_context& ctx() { return ctx_; }

    thread_pool_status status() const noexcept { return pool_status_; }

    std::size_t size() const noexcept { return pool_size_; }

    void start() {
        if (pool_status_ != thread_pool_status::CREATED) {
            return;
        }
        thread_pool_.reserve(pool_size_);
        for (std::size_t i = 0; i < pool_size_; ++i) {
            thread_pool_.emplace_back([this]() { ctx_.run(); });
        }
        pool_status_ = thread_pool_status::RUNNING;
    }

    // Runs `job` on one of the pool threads. An exception thrown by the job is stored in the future.
    template<typename Job>
    std::future<std::invoke_result_t<Job&>> submit(Job job) {
        using result_t = std::invoke_result_t<Job&>;
        auto task = std::make_shared<std::packaged_task<result_t()>>(std::move(job));
        auto future = task->get_future();
        boost::asio::post(ctx_, [task]() { (*task)(); });
        return future;
    }

    // Lets the queued jobs finish, then joins the threads.
    void stop() {
        if (pool_status_ != thread_pool_status::RUNNING) {
            return;
        }
        work_guard_.reset();
        for (auto& t : thread_pool_) {
            t.join();
        }
        thread_pool_.clear();
        ctx_.stop();
        pool_status_ = thread_pool_status::STOPPED;
    }

private:
    boost::asio::io_context ctx_;
    std::size_t pool_size_;
    std::vector<std::jthread> thread_pool_;
    thread_pool_status pool_status_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
};
