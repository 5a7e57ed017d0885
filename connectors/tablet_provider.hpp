// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "tablet_endpoint.hpp"

#include "utility/logger.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tablet {

    // Source of tablets for one shard. Shared by every reader scanning that shard, so
    // implementations must allow concurrent get/return.
    class ITabletProvider {
    public:
        virtual ~ITabletProvider() = default;
        // Throws when no tablet is available right now; callers treat that as transient.
        virtual tablet_handle get_tablet() = 0;
        virtual void return_tablet(tablet_handle tablet) = 0;
        virtual std::string description() const = 0;
    };

    // Hands out a fixed set of endpoints in rotation, so a failover after get_tablet() lands on the
    // next replica whenever the shard has more than one.
    class round_robin_tablet_provider : public ITabletProvider {
    public:
        round_robin_tablet_provider(std::string shard, std::vector<tablet_endpoint> endpoints);

        tablet_handle get_tablet() override;
        void return_tablet(tablet_handle tablet) override;
        std::string description() const override;

        // number of handles given out and not returned yet, per alias
        std::map<std::string, std::size_t> in_use() const;
        std::size_t size() const noexcept { return tablets_.size(); }

    private:
        log_t log_;
        std::string shard_;
        std::vector<tablet_handle> tablets_;
        std::size_t next_{0};
        std::map<std::string, std::size_t> in_use_;
        mutable std::mutex mutex_;
    };

} // namespace tablet
