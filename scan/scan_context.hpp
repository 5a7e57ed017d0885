// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace scan {

    enum class context_error : uint8_t
    {
        NONE,
        CANCELLED,
        DEADLINE_EXCEEDED,
    };

    // Cancellation and deadline shared by every blocking step of a scan. A child context finishes
    // when its parent does or when its own deadline passes, whichever comes first.
    class scan_context {
    public:
        using clock = std::chrono::steady_clock;

        scan_context() = default;
        scan_context(const scan_context&) = delete;
        scan_context& operator=(const scan_context&) = delete;

        static std::shared_ptr<scan_context> make() { return std::make_shared<scan_context>(); }

        static std::shared_ptr<scan_context> with_deadline(const std::shared_ptr<scan_context>& parent,
                                                           clock::time_point deadline) {
            auto child = std::make_shared<scan_context>();
            child->parent_ = parent;
            child->deadline_ = deadline;
            if (auto parent_deadline = parent->deadline()) {
                child->deadline_ = std::min(deadline, *parent_deadline);
            }
            parent->add_child(child);
            return child;
        }

        static std::shared_ptr<scan_context> with_timeout(const std::shared_ptr<scan_context>& parent,
                                                          clock::duration timeout) {
            return with_deadline(parent, clock::now() + timeout);
        }

        void cancel() {
            std::vector<std::weak_ptr<scan_context>> children;
            {
                std::lock_guard<std::mutex> lock(m_);
                if (cancelled_) {
                    return;
                }
                cancelled_ = true;
                children.swap(children_);
            }
            cv_.notify_all();
            for (auto& weak_child : children) {
                if (auto child = weak_child.lock()) {
                    child->cancel();
                }
            }
        }

        context_error error() const {
            {
                std::lock_guard<std::mutex> lock(m_);
                if (cancelled_) {
                    return context_error::CANCELLED;
                }
            }
            if (parent_) {
                if (auto parent_error = parent_->error(); parent_error != context_error::NONE) {
                    return parent_error;
                }
            }
            if (deadline_ && clock::now() >= *deadline_) {
                return context_error::DEADLINE_EXCEEDED;
            }
            return context_error::NONE;
        }

        bool done() const { return error() != context_error::NONE; }

        std::optional<clock::time_point> deadline() const { return deadline_; }

        clock::duration time_left() const {
            if (!deadline_) {
                return clock::duration::max();
            }
            return std::max(clock::duration::zero(), *deadline_ - clock::now());
        }

        // Sleeps for `duration`, waking early when the context finishes.
        // Returns true when the whole duration elapsed.
        bool wait_for(clock::duration duration) const {
            auto wake_up = clock::now() + duration;
            bool cut_by_deadline = false;
            if (deadline_ && *deadline_ < wake_up) {
                wake_up = *deadline_;
                cut_by_deadline = true;
            }
            std::unique_lock<std::mutex> lock(m_);
            bool cancelled = cv_.wait_until(lock, wake_up, [this]() { return cancelled_; });
            return !cancelled && !cut_by_deadline;
        }

    private:
        void add_child(const std::shared_ptr<scan_context>& child) {
            bool already_cancelled = false;
            {
                std::lock_guard<std::mutex> lock(m_);
                already_cancelled = cancelled_;
                if (!already_cancelled) {
                    children_.erase(std::remove_if(children_.begin(),
                                                   children_.end(),
                                                   [](const auto& weak_child) { return weak_child.expired(); }),
                                    children_.end());
                    children_.push_back(child);
                }
            }
            if (already_cancelled) {
                child->cancel();
            }
        }

        std::shared_ptr<scan_context> parent_;
        std::optional<clock::time_point> deadline_;
        bool cancelled_{false};
        std::vector<std::weak_ptr<scan_context>> children_;
        mutable std::mutex m_;
        mutable std::condition_variable cv_;
    };

    using scan_context_ptr = std::shared_ptr<scan_context>;

    inline scan_context_ptr make_scan_context() { return scan_context::make(); }

} // namespace scan
