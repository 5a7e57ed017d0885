// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace tablet {

    // Address of one storage-node process serving a shard replica.
    struct tablet_endpoint {
        std::string alias;
        std::string shard;
        std::string host;
        uint16_t port = 3306;
        std::string username;
        std::string password;
        std::string database;
    };

    using tablet_handle = std::shared_ptr<const tablet_endpoint>;

    inline std::string alias_of(const tablet_handle& tablet) { return tablet ? tablet->alias : "unknown"; }

    // shard=alias@user:password@host:port/database  (":password", ":port" and "/database" are optional)
    tablet_endpoint parse_tablet_endpoint(std::string_view text);

    inline std::ostream& operator<<(std::ostream& os, const tablet_endpoint& endpoint) {
        os << "Alias: " << endpoint.alias << std::endl;
        os << "Shard: " << endpoint.shard << std::endl;
        os << "Host: " << endpoint.host << std::endl;
        os << "Port: " << endpoint.port << std::endl;
        os << "Username: " << endpoint.username << std::endl;
        os << "Database: " << endpoint.database << std::endl;
        return os;
    }

} // namespace tablet
