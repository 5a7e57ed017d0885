// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "scan/scan_error.hpp"
#include "scan/stream_session.hpp"

#include "../mock/mock_config.hpp"
#include "../mock/tablet_connector.hpp"
#include "../mock/tablet_provider.hpp"

#include <catch2/catch.hpp>
#include <memory>
#include <string>

using namespace scan;

TEST_CASE("stream session: a broken stream raises a transient error") {
    auto state = std::make_shared<mock_tablet_state>(
        mock_config{.keys = key_range(1, 10), .plans = {{.fail_after_batches = 1}}});
    auto provider =
        std::make_shared<tablet::round_robin_tablet_provider>("-80", tablet::make_endpoints("-80", {"t1"}));
    auto ctx = make_scan_context();

    auto [session, status] = stream_session::open(provider, tablet::make_mock_connector_factory(state));
    REQUIRE(status.ok());
    REQUIRE(session->start("SELECT `id`,`name` FROM `orders` ORDER BY `id`", 0, *ctx).ok());
    REQUIRE(session->recv(*ctx));

    try {
        session->recv(*ctx);
        FAIL("expected the stream to break");
    } catch (const scan_error& e) {
        REQUIRE(e.kind() == error_kind::TRANSIENT);
        REQUIRE(std::string(e.what()).find("tablet=t1: ") == 0);
        REQUIRE(std::string(e.what()).find(state->config.error_message) != std::string::npos);
    }

    // restarting on the same session is allowed
    REQUIRE(session->start("SELECT `id`,`name` FROM `orders` WHERE `id`>3 ORDER BY `id`", 0, *ctx).ok());
    REQUIRE(session->recv(*ctx)->rows.front().at(0) == value_t(4));

    session->close();
    REQUIRE(provider->in_use().empty());
}
