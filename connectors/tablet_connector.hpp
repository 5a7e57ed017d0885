// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "tablet_endpoint.hpp"

#include "scan/result_batch.hpp"
#include "scan/scan_context.hpp"
#include "utility/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/execution_state.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tablet {

    namespace mysql = boost::mysql;
    namespace asio = boost::asio;

    // How often a blocked receive looks at its scan context.
    inline constexpr std::chrono::milliseconds RECV_POLL_INTERVAL{50};

    inline constexpr std::string_view CONSISTENT_SNAPSHOT_QUERY =
        "START TRANSACTION WITH CONSISTENT SNAPSHOT, READ ONLY";

    enum class Status
    {
        Created,
        Connected,
        Streaming,
        Disconnected,
        Closed
    };

    // Row stream of one streaming query. The first batch carries the fields and no rows;
    // an empty optional means the query is exhausted. Failures are thrown.
    class IRowStream {
    public:
        virtual ~IRowStream() = default;
        virtual std::optional<scan::result_batch_t> recv(const scan::scan_context& ctx) = 0;
    };

    // One connection to one tablet.
    class ITabletConnector {
    public:
        virtual ~ITabletConnector() = default;
        virtual Status status() const noexcept = 0;
        virtual std::string alias() const noexcept = 0;
        // Starts a streaming scan; a non-zero tx_id runs it inside that transaction.
        // The returned stream must not outlive the connector.
        virtual std::unique_ptr<IRowStream>
        stream_execute(const std::string& query, int64_t tx_id, const scan::scan_context& ctx) = 0;
        virtual void close() = 0;
    };

    // The dialer: builds (without touching the network) a connector for a tablet.
    // Throwing from here means the dialer is misconfigured, not that the tablet is down.
    using connector_factory = std::function<std::unique_ptr<ITabletConnector>(const tablet_handle&)>;

    std::unique_ptr<ITabletConnector> make_mysql_connector(const tablet_handle& tablet);

    class Connector : public ITabletConnector {
    public:
        explicit Connector(tablet_handle tablet);
        ~Connector() override;

        Status status() const noexcept override;
        std::string alias() const noexcept override;
        std::unique_ptr<IRowStream>
        stream_execute(const std::string& query, int64_t tx_id, const scan::scan_context& ctx) override;
        void close() override;

    private:
        class row_stream;

        void connect(const scan::scan_context& ctx);
        void begin_snapshot(int64_t tx_id, const scan::scan_context& ctx);
        std::optional<scan::result_batch_t> read_batch(const scan::scan_context& ctx);
        [[noreturn]] void fail(std::string_view operation, const boost::system::error_code& ec);

        log_t log_;
        tablet_handle tablet_;
        asio::io_context io_ctx_;
        mysql::any_connection conn_;
        mysql::connect_params params_;
        mysql::diagnostics diag_;
        mysql::execution_state st_;
        Status status_;
        int64_t snapshot_tx_id_{0};
        bool fields_sent_{false};
    };

} // namespace tablet
