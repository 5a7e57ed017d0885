// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "connectors/tablet_endpoint.hpp"
#include "connectors/tablet_provider.hpp"

#include "../../mock/tablet_provider.hpp"

#include <catch2/catch.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tablet;

TEST_CASE("tablet endpoint: parse") {
    auto endpoint = parse_tablet_endpoint("-80=zone1-0100@vt_app:p@ss@10.0.0.5:15306/vt_commerce");
    REQUIRE(endpoint.shard == "-80");
    REQUIRE(endpoint.alias == "zone1-0100");
    REQUIRE(endpoint.username == "vt_app");
    REQUIRE(endpoint.password == "p@ss");
    REQUIRE(endpoint.host == "10.0.0.5");
    REQUIRE(endpoint.port == 15306);
    REQUIRE(endpoint.database == "vt_commerce");

    auto minimal = parse_tablet_endpoint("0=t1@root@db");
    REQUIRE(minimal.host == "db");
    REQUIRE(minimal.port == 3306);
    REQUIRE(minimal.password.empty());
    REQUIRE(minimal.database.empty());
}

TEST_CASE("tablet endpoint: rejects malformed text") {
    REQUIRE_THROWS_AS(parse_tablet_endpoint("t1@root@db"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_tablet_endpoint("0=t1@db"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_tablet_endpoint("0=t1@root@db:port"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_tablet_endpoint("0=t1@root@:3306"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_tablet_endpoint("0=t1@:pw@db"), std::invalid_argument);
}

TEST_CASE("round robin provider: rotation") {
    round_robin_tablet_provider provider("-80", make_endpoints("-80", {"t1", "t2", "t3"}));
    REQUIRE(provider.size() == 3);
    REQUIRE(provider.description() == "shard -80 (3 tablets, round robin)");

    std::vector<std::string> order;
    for (int i = 0; i < 4; ++i) {
        auto tablet = provider.get_tablet();
        order.push_back(tablet->alias);
        provider.return_tablet(tablet);
    }
    REQUIRE(order == std::vector<std::string>{"t1", "t2", "t3", "t1"});
    REQUIRE(provider.in_use().empty());
}

TEST_CASE("round robin provider: tracks handed out tablets") {
    round_robin_tablet_provider provider("80-", make_endpoints("80-", {"t1"}));
    auto first = provider.get_tablet();
    auto second = provider.get_tablet();
    REQUIRE(provider.in_use().at("t1") == 2);

    provider.return_tablet(first);
    REQUIRE(provider.in_use().at("t1") == 1);
    provider.return_tablet(second);
    REQUIRE(provider.in_use().empty());

    // unknown handles are ignored
    provider.return_tablet(second);
    provider.return_tablet(nullptr);
    REQUIRE(provider.in_use().empty());
}

TEST_CASE("round robin provider: empty shard") {
    round_robin_tablet_provider provider("-", {});
    REQUIRE_THROWS_AS(provider.get_tablet(), std::runtime_error);
}

TEST_CASE("round robin provider: concurrent readers") {
    auto provider = std::make_shared<round_robin_tablet_provider>("-", make_endpoints("-", {"t1", "t2"}));
    {
        std::vector<std::jthread> readers;
        for (int i = 0; i < 8; ++i) {
            readers.emplace_back([provider]() {
                for (int j = 0; j < 100; ++j) {
                    provider->return_tablet(provider->get_tablet());
                }
            });
        }
    }
    REQUIRE(provider->in_use().empty());
}

TEST_CASE("flaky provider: fails the first calls") {
    auto inner = std::make_shared<round_robin_tablet_provider>("-", make_endpoints("-", {"t1"}));
    FlakyTabletProvider provider(inner, 1);
    REQUIRE_THROWS_AS(provider.get_tablet(), std::runtime_error);
    REQUIRE(provider.get_tablet()->alias == "t1");
    REQUIRE(provider.calls() == 2);
}
