// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "scan/resumable_reader.hpp"
#include "utility/scan_stats.hpp"

#include "../mock/mock_config.hpp"
#include "../mock/tablet_connector.hpp"
#include "../mock/tablet_provider.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace scan;
using namespace std::chrono_literals;

namespace {
    struct fixture {
        explicit fixture(mock_config config, std::vector<std::string> aliases = {"t1"})
            : state(std::make_shared<mock_tablet_state>(std::move(config)))
            , provider(std::make_shared<tablet::round_robin_tablet_provider>(
                  "-80",
                  tablet::make_endpoints("-80", aliases)))
            , ctx(make_scan_context()) {
            scan_stats().reset();
        }

        reader_params params(chunk_t chunk) const {
            return {
                .ctx = ctx,
                .provider = provider,
                .table = make_table_descriptor("orders", {"id", "name"}, {"id"}),
                .chunk = std::move(chunk),
                .allow_multiple_retries = true,
                .retry = {.retry_budget = 10s, .backoff_interval = 1ms},
                .make_connector = tablet::make_mock_connector_factory(state),
            };
        }

        std::shared_ptr<mock_tablet_state> state;
        std::shared_ptr<tablet::round_robin_tablet_provider> provider;
        scan_context_ptr ctx;
    };

    std::vector<int64_t> drain(resumable_reader& reader) {
        std::vector<int64_t> keys;
        while (auto batch = reader.next()) {
            for (const auto& row : batch->rows) {
                keys.push_back(row.at(0).as_int64());
            }
        }
        return keys;
    }

    template<typename F>
    error_kind kind_of_failure(F&& f) {
        try {
            f();
        } catch (const scan_error& e) {
            return e.kind();
        }
        FAIL("no scan_error thrown");
        return error_kind::FATAL;
    }
} // namespace

TEST_CASE("resumable reader: uninterrupted scan of a chunk") {
    fixture fx({.keys = key_range(1, 60)});
    auto reader = make_resumable_reader(fx.params({value_t(5), value_t(50)}));

    REQUIRE(reader->state() == reader_state::STREAMING);
    REQUIRE(reader->fields().size() == 2);
    REQUIRE(reader->fields()[0].name == "id");
    REQUIRE(reader->query() == "SELECT `id`,`name` FROM `orders` WHERE `id`>=5 AND `id`<50 ORDER BY `id`");

    REQUIRE(drain(*reader) == key_range(5, 49));
    REQUIRE(reader->last_row()->at(0) == value_t(49));
    REQUIRE(scan_stats().retry_count.load() == 0);
    REQUIRE(scan_stats().streaming_query_started.get("t1") == 1);
}

TEST_CASE("resumable reader: resumes after the last delivered row") {
    fixture fx({.keys = key_range(1, 60), .batch_size = 3, .plans = {{.fail_after_batches = 1}}});
    auto reader = make_resumable_reader(fx.params({value_t(5), value_t(50)}));

    auto first = reader->next();
    REQUIRE(first);
    REQUIRE(first->rows.size() == 3);
    REQUIRE(reader->last_row()->at(0) == value_t(7));

    // the stream breaks here and is restarted on the same tablet
    auto second = reader->next();
    REQUIRE(second);
    REQUIRE(second->rows.front().at(0) == value_t(8));
    REQUIRE(reader->query() == "SELECT `id`,`name` FROM `orders` WHERE `id`>7 AND `id`<50 ORDER BY `id`");

    std::vector<int64_t> keys{5, 6, 7};
    for (const auto& row : second->rows) {
        keys.push_back(row.at(0).as_int64());
    }
    auto rest = drain(*reader);
    keys.insert(keys.end(), rest.begin(), rest.end());
    REQUIRE(keys == key_range(5, 49));

    REQUIRE(fx.state->stream_tablets == std::vector<std::string>{"t1", "t1"});
    REQUIRE(scan_stats().retry_count.load() == 1);
    REQUIRE(scan_stats().streaming_query_errors.get("t1") == 1);
    REQUIRE(scan_stats().streaming_query_started.get("t1") == 2);
    REQUIRE(scan_stats().restarts_same_tablet.get("t1") == 1);
    REQUIRE(scan_stats().restarts_different_tablet.load() == 0);
}

TEST_CASE("resumable reader: break before the first row restarts from the chunk start") {
    fixture fx({.keys = key_range(1, 20), .plans = {{.fail_after_batches = 0}}});
    auto reader = make_resumable_reader(fx.params({value_t(3), value_t(9)}));

    REQUIRE(drain(*reader) == key_range(3, 8));
    REQUIRE(fx.state->queries.size() == 2);
    REQUIRE(fx.state->queries[1] == fx.state->queries[0]);
}

TEST_CASE("resumable reader: fails over to another tablet") {
    fixture fx({.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}, {.fail_start = true}}},
               {"t1", "t2"});
    auto reader = make_resumable_reader(fx.params({}));

    REQUIRE(drain(*reader) == key_range(1, 30));
    REQUIRE(fx.state->stream_tablets == std::vector<std::string>{"t1", "t1", "t2"});
    REQUIRE(reader->tablet_alias() == "t2");
    REQUIRE(scan_stats().retry_count.load() == 2);
    REQUIRE(scan_stats().restarts_different_tablet.load() == 1);
    REQUIRE(scan_stats().restarts_same_tablet.get("t1") == 0);
    REQUIRE(scan_stats().streaming_query_errors.get("t1") == 2);
    // t1 went back to the provider before t2 was taken
    REQUIRE(fx.provider->in_use() == std::map<std::string, std::size_t>{{"t2", 1}});
}

TEST_CASE("resumable reader: single retry budget") {
    fixture fx({.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}, {.fail_start = true}}},
               {"t1", "t2"});
    auto params = fx.params({});
    params.allow_multiple_retries = false;
    auto reader = make_resumable_reader(std::move(params));

    REQUIRE(reader->next());
    try {
        reader->next();
        FAIL("expected the reader to give up");
    } catch (const scan_error& e) {
        REQUIRE(e.kind() == error_kind::BUDGET_EXHAUSTED);
        REQUIRE(std::string(e.what()).find("shard -80") != std::string::npos);
    }
    REQUIRE(reader->state() == reader_state::FAILED);
    // no failover happened
    REQUIRE(fx.state->stream_tablets == std::vector<std::string>{"t1", "t1"});
    REQUIRE(scan_stats().retry_count.load() == 1);

    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::FATAL);
}

TEST_CASE("resumable reader: retry budget runs out") {
    fixture fx({.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}}, .default_plan = {.fail_start = true}},
               {"t1", "t2"});
    auto params = fx.params({});
    params.retry = {.retry_budget = 300ms, .backoff_interval = 20ms};
    auto counting = std::make_shared<tablet::FlakyTabletProvider>(fx.provider, 0);
    params.provider = counting;
    auto reader = make_resumable_reader(std::move(params));

    REQUIRE(reader->next());
    auto start = scan_context::clock::now();
    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::DEADLINE_EXCEEDED);
    REQUIRE(scan_context::clock::now() - start < 5s);
    REQUIRE(fx.ctx->error() == context_error::NONE);

    const auto retries = scan_stats().retry_count.load();
    REQUIRE(retries >= 4);

    // attempt 2 stays on t1, every later attempt takes the next tablet in rotation
    const auto& streams = fx.state->stream_tablets;
    REQUIRE(streams.size() >= 5);
    REQUIRE(std::vector<std::string>(streams.begin(), streams.begin() + 5) ==
            std::vector<std::string>{"t1", "t1", "t2", "t1", "t2"});

    // one dial at construction, then one per attempt from the third on
    const auto& dialed = fx.state->dialed;
    REQUIRE(dialed.size() == static_cast<std::size_t>(retries));
    REQUIRE(std::vector<std::string>(dialed.begin(), dialed.begin() + 4) ==
            std::vector<std::string>{"t1", "t2", "t1", "t2"});

    // the old tablet is returned before a new one is taken
    REQUIRE(counting->max_outstanding() == 1);
    REQUIRE(counting->outstanding() <= 1);
    REQUIRE(fx.provider->in_use().size() <= 1);
    reader.reset();
    REQUIRE(counting->outstanding() == 0);
    REQUIRE(fx.provider->in_use().empty());
}

TEST_CASE("resumable reader: caller deadline stops the retries") {
    fixture fx({.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}}, .default_plan = {.fail_start = true}},
               {"t1", "t2"});
    auto root = make_scan_context();
    fx.ctx = scan_context::with_timeout(root, 300ms);
    auto params = fx.params({});
    params.retry = {.retry_budget = 1h, .backoff_interval = 20ms};
    auto reader = make_resumable_reader(std::move(params));
    REQUIRE(reader->next());

    auto start = scan_context::clock::now();
    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::DEADLINE_EXCEEDED);
    REQUIRE(scan_context::clock::now() - start < 5s);
    REQUIRE(reader->state() == reader_state::FAILED);
    REQUIRE(fx.state->stream_tablets.size() >= 3);
    REQUIRE(fx.ctx->error() == context_error::DEADLINE_EXCEEDED);
    REQUIRE_FALSE(root->done());
}

TEST_CASE("resumable reader: cancellation during backoff") {
    fixture fx({.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}, {.fail_start = true}}},
               {"t1", "t2"});
    auto params = fx.params({});
    params.retry = {.retry_budget = 1h, .backoff_interval = 30s};
    auto reader = make_resumable_reader(std::move(params));
    REQUIRE(reader->next());

    std::jthread canceller([ctx = fx.ctx]() {
        std::this_thread::sleep_for(100ms);
        ctx->cancel();
    });

    auto start = scan_context::clock::now();
    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::CANCELLED);
    REQUIRE(scan_context::clock::now() - start < 10s);
    // the failover attempt never ran
    REQUIRE(fx.state->stream_tablets.size() == 2);
}

TEST_CASE("resumable reader: dialer failure is not retried") {
    mock_config config{.keys = key_range(1, 30), .plans = {{.fail_after_batches = 1}, {.fail_start = true}}};
    config.failing_dial_aliases = {"t2"};
    fixture fx(std::move(config), {"t1", "t2", "t3"});
    auto reader = make_resumable_reader(fx.params({}));

    REQUIRE(reader->next());
    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::FATAL);
    REQUIRE(fx.state->dialed == std::vector<std::string>{"t1", "t2"});
    REQUIRE(fx.provider->in_use().empty());
}

TEST_CASE("resumable reader: construction retries once") {
    SECTION("provider recovers") {
        fixture fx({.keys = key_range(1, 5)});
        auto params = fx.params({});
        auto flaky = std::make_shared<tablet::FlakyTabletProvider>(fx.provider, 1);
        params.provider = flaky;
        auto reader = make_resumable_reader(std::move(params));

        REQUIRE(flaky->calls() == 2);
        REQUIRE(scan_stats().retry_count.load() == 1);
        REQUIRE(drain(*reader) == key_range(1, 5));
    }
    SECTION("stream start fails twice") {
        fixture fx({.keys = key_range(1, 5), .default_plan = {.fail_start = true}});
        REQUIRE(kind_of_failure([&]() { make_resumable_reader(fx.params({})); }) == error_kind::INIT_FAILED);
        REQUIRE(fx.state->stream_tablets.size() == 2);
        REQUIRE(scan_stats().retry_count.load() == 1);
        REQUIRE(fx.provider->in_use().empty());
    }
    SECTION("dialer failure is final") {
        mock_config config{.keys = key_range(1, 5)};
        config.failing_dial_aliases = {"t1"};
        fixture fx(std::move(config));
        try {
            make_resumable_reader(fx.params({}));
            FAIL("expected construction to fail");
        } catch (const scan_error& e) {
            REQUIRE(e.kind() == error_kind::INIT_FAILED);
            REQUIRE(std::string(e.what()).find("retryable false") != std::string::npos);
        }
        REQUIRE(fx.state->dialed.size() == 1);
        REQUIRE(scan_stats().retry_count.load() == 0);
    }
}

TEST_CASE("resumable reader: close is idempotent and returns the tablet") {
    fixture fx({.keys = key_range(1, 10)});
    auto reader = make_resumable_reader(fx.params({}));
    REQUIRE(fx.provider->in_use().at("t1") == 1);

    reader->close();
    reader->close();
    REQUIRE(reader->state() == reader_state::CLOSED);
    REQUIRE(fx.provider->in_use().empty());
    REQUIRE(fx.state->closed == 1);
    REQUIRE(reader->fields().empty());
    REQUIRE(kind_of_failure([&]() { reader->next(); }) == error_kind::FATAL);

    reader.reset();
    REQUIRE(fx.provider->in_use().empty());
}

TEST_CASE("resumable reader: empty chunk") {
    fixture fx({.keys = key_range(1, 10)});
    auto reader = make_resumable_reader(fx.params({value_t(100), value_t(200)}));
    REQUIRE_FALSE(reader->next());
    REQUIRE_FALSE(reader->last_row());
    // end of stream stays the end
    REQUIRE_FALSE(reader->next());
}

TEST_CASE("resumable reader: transaction id reaches every stream") {
    fixture fx({.keys = key_range(1, 10), .plans = {{.fail_after_batches = 1}}});
    auto reader = make_transactional_resumable_reader(fx.params({}), 42);
    REQUIRE(reader->tx_id() == 42);
    REQUIRE(drain(*reader) == key_range(1, 10));
    REQUIRE(fx.state->tx_ids == std::vector<int64_t>{42, 42});

    REQUIRE_THROWS_AS(make_transactional_resumable_reader(fx.params({}), 0), std::invalid_argument);
}

TEST_CASE("resumable reader: rejects incomplete parameters") {
    fixture fx({.keys = key_range(1, 10)});
    auto params = fx.params({});
    params.table = std::make_shared<table_descriptor_t>(table_descriptor_t{"log", {"line"}, {}});
    REQUIRE_THROWS_AS(make_resumable_reader(std::move(params)), std::invalid_argument);

    auto no_provider = fx.params({});
    no_provider.provider = nullptr;
    REQUIRE_THROWS_AS(make_resumable_reader(std::move(no_provider)), std::invalid_argument);
}
