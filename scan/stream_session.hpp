// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "result_batch.hpp"
#include "scan_context.hpp"

#include "connectors/tablet_connector.hpp"
#include "connectors/tablet_provider.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scan {

    enum class attempt_outcome : uint8_t
    {
        SUCCEEDED,
        RETRYABLE_FAILURE,
        FATAL_FAILURE,
    };

    struct attempt_status {
        attempt_outcome outcome = attempt_outcome::SUCCEEDED;
        std::string error;

        bool ok() const noexcept { return outcome == attempt_outcome::SUCCEEDED; }
        bool retryable() const noexcept { return outcome == attempt_outcome::RETRYABLE_FAILURE; }

        static attempt_status succeeded() { return {}; }
        static attempt_status retryable_failure(std::string error) {
            return {attempt_outcome::RETRYABLE_FAILURE, std::move(error)};
        }
        static attempt_status fatal_failure(std::string error) {
            return {attempt_outcome::FATAL_FAILURE, std::move(error)};
        }
    };

    class stream_session;

    struct open_result {
        std::unique_ptr<stream_session> session;
        attempt_status status;
    };

    // One tablet, one connection, at most one open streaming query.
    class stream_session {
    public:
        stream_session(std::shared_ptr<tablet::ITabletProvider> provider,
                       tablet::tablet_handle tablet,
                       std::unique_ptr<tablet::ITabletConnector> connector);
        ~stream_session();

        stream_session(const stream_session&) = delete;
        stream_session& operator=(const stream_session&) = delete;

        // Takes a tablet from the provider and dials it. Running out of tablets is retryable,
        // a dialer failure is not.
        static open_result open(const std::shared_ptr<tablet::ITabletProvider>& provider,
                                const tablet::connector_factory& make_connector);

        // Issues the scan and reads its field metadata. Every failure here is retryable.
        attempt_status start(const std::string& query, int64_t tx_id, const scan_context& ctx);

        // Next batch of the open stream, nothing at the end of it. A failed receive throws
        // scan_error(TRANSIENT); the stream cannot be read again until the next start.
        std::optional<result_batch_t> recv(const scan_context& ctx);

        // Drops the connection and gives the tablet back to the provider. Idempotent.
        void close();

        const std::vector<field_t>& fields() const noexcept { return fields_; }
        std::string tablet_alias() const { return tablet::alias_of(tablet_); }
        bool is_open() const noexcept { return connector_ != nullptr; }

    private:
        log_t log_;
        std::shared_ptr<tablet::ITabletProvider> provider_;
        tablet::tablet_handle tablet_;
        std::unique_ptr<tablet::ITabletConnector> connector_;
        std::unique_ptr<tablet::IRowStream> stream_;
        std::vector<field_t> fields_;
    };

} // namespace scan
