// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "tablet_provider.hpp"

#include <stdexcept>

namespace tablet {

    round_robin_tablet_provider::round_robin_tablet_provider(std::string shard, std::vector<tablet_endpoint> endpoints)
        : log_(get_logger(logger_tag::TABLET_PROVIDER))
        , shard_{std::move(shard)} {
        tablets_.reserve(endpoints.size());
        for (auto& endpoint : endpoints) {
            if (endpoint.shard.empty()) {
                endpoint.shard = shard_;
            }
            tablets_.push_back(std::make_shared<const tablet_endpoint>(std::move(endpoint)));
        }
    }

    tablet_handle round_robin_tablet_provider::get_tablet() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tablets_.empty()) {
            throw std::runtime_error("no tablets available for shard " + shard_);
        }
        auto tablet = tablets_[next_ % tablets_.size()];
        next_ = (next_ + 1) % tablets_.size();
        ++in_use_[tablet->alias];
        log_->debug("shard={} handing out tablet={}", shard_, tablet->alias);
        return tablet;
    }

    void round_robin_tablet_provider::return_tablet(tablet_handle tablet) {
        if (!tablet) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_use_.find(tablet->alias);
        if (it == in_use_.end() || it->second == 0) {
            log_->warn("shard={} tablet={} returned but was not handed out", shard_, tablet->alias);
            return;
        }
        if (--it->second == 0) {
            in_use_.erase(it);
        }
    }

    std::string round_robin_tablet_provider::description() const {
        return "shard " + shard_ + " (" + std::to_string(tablets_.size()) + " tablets, round robin)";
    }

    std::map<std::string, std::size_t> round_robin_tablet_provider::in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

} // namespace tablet
