// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "chunk.hpp"
#include "result_batch.hpp"
#include "retry_config.hpp"
#include "scan_context.hpp"
#include "scan_error.hpp"
#include "stream_session.hpp"
#include "table_descriptor.hpp"

#include "connectors/tablet_connector.hpp"
#include "connectors/tablet_provider.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scan {

    enum class reader_state : uint8_t
    {
        CONNECTING,
        STREAMING,
        RETRYING,
        FAILED,
        CLOSED,
    };

    struct reader_params {
        scan_context_ptr ctx;
        std::shared_ptr<tablet::ITabletProvider> provider;
        table_descriptor_ptr table;
        chunk_t chunk;
        // false for tablets that may go away for good (e.g. offline sources): give up after a single
        // restart on the same tablet instead of failing over until the retry budget is spent
        bool allow_multiple_retries = true;
        retry_config retry = {};
        tablet::connector_factory make_connector = tablet::make_mysql_connector;
    };

    // Streams every row of a chunk in primary-key order from a tablet of one shard.
    // If the stream breaks, it is restarted after the last delivered row: first on the same tablet,
    // then on other tablets of the shard, until the retry budget or the caller's context runs out.
    // Rows are delivered exactly once, apart from rows written into the already scanned key range
    // while the scan was running.
    //
    // Not thread safe: one caller drives a reader.
    class resumable_reader {
    public:
        // Connects and starts the stream; retries once on a retryable failure.
        // Throws scan_error(INIT_FAILED) when that does not work out.
        explicit resumable_reader(reader_params params, int64_t tx_id = 0);
        ~resumable_reader();

        resumable_reader(const resumable_reader&) = delete;
        resumable_reader& operator=(const resumable_reader&) = delete;

        // Next batch of rows; an empty optional at the end of the chunk.
        // Throws scan_error when the stream cannot be restarted.
        std::optional<result_batch_t> next();

        const std::vector<field_t>& fields() const;

        // Returns the tablet to the provider. Safe to call repeatedly.
        void close();

        reader_state state() const noexcept { return state_; }
        const std::string& query() const noexcept { return query_; }
        const std::optional<row_t>& last_row() const noexcept { return last_row_; }
        std::string tablet_alias() const;
        int64_t tx_id() const noexcept { return tx_id_; }

    private:
        struct retry_attempt {
            attempt_status status;
            std::optional<result_batch_t> batch;
        };

        void try_to_connect();
        attempt_status replace_session();
        attempt_status start_stream(const scan_context& ctx);
        std::optional<result_batch_t> next_with_retries(std::string error);
        retry_attempt run_retry_attempt(int attempt, const scan_context& ctx);
        [[noreturn]] void fail(error_kind kind, const std::string& message);
        void remember_last_row(const std::optional<result_batch_t>& batch);

        log_t log_;
        scan_context_ptr ctx_;
        std::shared_ptr<tablet::ITabletProvider> provider_;
        table_descriptor_ptr table_;
        chunk_t chunk_;
        bool allow_multiple_retries_;
        retry_config retry_;
        tablet::connector_factory make_connector_;
        int64_t tx_id_;

        reader_state state_{reader_state::CONNECTING};
        std::unique_ptr<stream_session> session_;
        std::string query_;
        std::optional<row_t> last_row_;
        static const std::vector<field_t> no_fields_;
    };

    std::unique_ptr<resumable_reader> make_resumable_reader(reader_params params);

    // Same as make_resumable_reader, but every stream runs inside transaction `tx_id`.
    std::unique_ptr<resumable_reader> make_transactional_resumable_reader(reader_params params, int64_t tx_id);

} // namespace scan
