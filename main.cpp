// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include <charconv>
#include <csignal>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "connectors/tablet_endpoint.hpp"
#include "connectors/tablet_provider.hpp"
#include "fanout/shard_fanout.hpp"
#include "fanout/shard_scan.hpp"
#include "scan/scan_context.hpp"
#include "scan/scan_error.hpp"
#include "scan/table_descriptor.hpp"
#include "utility/logger.hpp"
#include "utility/scan_stats.hpp"

namespace po = boost::program_options;

namespace {
    std::vector<std::string> split_list(const std::string& text) {
        std::vector<std::string> parts;
        if (text.empty()) {
            return parts;
        }
        boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
        return parts;
    }

    // Integers become numeric bounds, anything else is compared as text. Empty means unbounded.
    scan::value_t parse_bound(const std::string& text) {
        if (text.empty()) {
            return {};
        }
        int64_t number = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (ec == std::errc() && end == text.data() + text.size()) {
            return number;
        }
        return text;
    }

    void print_counters(std::ostream& os) {
        auto& stats = scan_stats();
        os << "retries: " << stats.retry_count.load() << "\n";
        os << "restarts on a different tablet: " << stats.restarts_different_tablet.load() << "\n";
        for (const auto& [alias, count] : stats.streaming_query_started.snapshot()) {
            os << "tablet " << alias << ": streams started " << count
               << ", stream errors " << stats.streaming_query_errors.get(alias)
               << ", restarts on same tablet " << stats.restarts_same_tablet.get(alias) << "\n";
        }
    }
} // namespace

int main(int argc, char* argv[]) {
    // Default values
    std::vector<std::string> tablets;
    std::string table;
    std::string columns;
    std::string primary_key;
    std::string start;
    std::string end;
    int64_t retry_budget_sec = std::chrono::duration_cast<std::chrono::seconds>(scan::DEFAULT_RETRY_BUDGET).count();
    int64_t backoff_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(scan::DEFAULT_BACKOFF_INTERVAL).count();
    int64_t timeout_sec = 0;
    std::string log_dir = "/tmp/tabletscan/log";

    // Define command-line options
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message")
    ("tablet",
    po::value<std::vector<std::string>>(&tablets)->composing(),
    "Tablet as shard=alias@user:password@host:port/database, repeat for every tablet")
    ("table",
    po::value<std::string>(&table),
    "Table to scan")
    ("columns",
    po::value<std::string>(&columns),
    "Comma separated columns to select")
    ("pk",
    po::value<std::string>(&primary_key),
    "Comma separated primary key columns")
    ("start",
    po::value<std::string>(&start)->default_value(start),
    "Inclusive lower bound of the chunk on the first key column, empty for none")
    ("end",
    po::value<std::string>(&end)->default_value(end),
    "Exclusive upper bound of the chunk on the first key column, empty for none")
    ("retry-budget-sec",
    po::value<int64_t>(&retry_budget_sec)->default_value(retry_budget_sec),
    "How long a broken stream is retried")
    ("backoff-ms",
    po::value<int64_t>(&backoff_ms)->default_value(backoff_ms),
    "Pause between restart attempts")
    ("timeout-sec",
    po::value<int64_t>(&timeout_sec)->default_value(timeout_sec),
    "Deadline for the whole scan, 0 for none")
    ("single-retry",
    "Give up after one failed restart on the same tablet")
    ("log-dir",
    po::value<std::string>(&log_dir)->default_value(log_dir),
    "Directory for the log files");

    // Parse arguments
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    // Show help message if requested
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    if (tablets.empty() || table.empty() || columns.empty() || primary_key.empty()) {
        std::cerr << "--tablet, --table, --columns and --pk are required\n";
        std::cerr << desc << "\n";
        return 1;
    }

    initialize_all_loggers(log_dir);
    auto log = get_logger(logger_tag::SHARD_FANOUT);

    std::vector<fanout::shard_target> shards;
    fanout::shard_scan_request request;
    try {
        std::map<std::string, std::vector<tablet::tablet_endpoint>> by_shard;
        for (const auto& text : tablets) {
            auto endpoint = tablet::parse_tablet_endpoint(text);
            by_shard[endpoint.shard].push_back(std::move(endpoint));
        }
        for (auto& [shard, endpoints] : by_shard) {
            shards.push_back(
                {shard, std::make_shared<tablet::round_robin_tablet_provider>(shard, std::move(endpoints))});
        }

        auto pk = split_list(primary_key);
        request.table =
            scan::make_table_descriptor(table, scan::reorder_columns_primary_key_first(split_list(columns), pk), pk);
        request.chunk = {parse_bound(start), parse_bound(end)};
        request.allow_multiple_retries = vm.count("single-retry") == 0;
        request.retry = {std::chrono::seconds(retry_budget_sec), std::chrono::milliseconds(backoff_ms)};
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    auto root = scan::make_scan_context();
    request.ctx = timeout_sec > 0 ? scan::scan_context::with_timeout(root, std::chrono::seconds(timeout_sec)) : root;

    // Ctrl-C cancels the scan; readers waiting in a backoff wake up at once.
    boost::asio::io_context signal_ctx;
    boost::asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
    signals.async_wait([root, log](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            log->warn("signal {} received, cancelling the scan", signal);
            root->cancel();
        }
    });
    std::jthread signal_thread([&signal_ctx]() { signal_ctx.run(); });

    auto output = fanout::for_all_shards(shards, [&request](const fanout::shard_target& shard) {
        return fanout::scan_shard_chunk(request, shard);
    });

    signals.cancel();
    signal_ctx.stop();

    for (const auto& [name, response] : output.responses) {
        std::cout << "shard " << name << " (tablet " << response.tablet_alias << "): " << response.rows
                  << " rows, " << response.batches << " batches, checksum " << std::hex << response.checksum
                  << std::dec;
        if (response.last_row) {
            std::cout << ", last row " << scan::to_string(*response.last_row);
        }
        std::cout << "\n";
    }
    print_counters(std::cout);

    if (!output.ok()) {
        try {
            output.rethrow_if_failed();
        } catch (const scan::scan_error& e) {
            std::cerr << "shard " << output.first_error_shard << " failed (" << scan::to_string(e.kind())
                      << "): " << e.what() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "shard " << output.first_error_shard << " failed: " << e.what() << "\n";
        }
        return 1;
    }

    return 0;
}
