// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "stream_session.hpp"

#include "scan_error.hpp"

#include "utility/scan_stats.hpp"

#include <stdexcept>

namespace scan {

    stream_session::stream_session(std::shared_ptr<tablet::ITabletProvider> provider,
                                   tablet::tablet_handle tablet,
                                   std::unique_ptr<tablet::ITabletConnector> connector)
        : log_(get_logger(logger_tag::STREAM_SESSION))
        , provider_(std::move(provider))
        , tablet_(std::move(tablet))
        , connector_(std::move(connector)) {}

    stream_session::~stream_session() { close(); }

    open_result stream_session::open(const std::shared_ptr<tablet::ITabletProvider>& provider,
                                     const tablet::connector_factory& make_connector) {
        tablet::tablet_handle tablet;
        try {
            tablet = provider->get_tablet();
        } catch (const std::exception& e) {
            return {nullptr,
                    attempt_status::retryable_failure("tablet=unknown: failed get tablet for streaming query: " +
                                                      std::string(e.what()))};
        }

        std::unique_ptr<tablet::ITabletConnector> connector;
        try {
            connector = make_connector(tablet);
        } catch (const std::exception& e) {
            provider->return_tablet(tablet);
            return {nullptr,
                    attempt_status::fatal_failure("tablet=" + tablet::alias_of(tablet) +
                                                  ": failed to get dialer for tablet: " + e.what())};
        }
        if (!connector) {
            provider->return_tablet(tablet);
            return {nullptr,
                    attempt_status::fatal_failure("tablet=" + tablet::alias_of(tablet) +
                                                  ": dialer returned no connection")};
        }

        return {std::make_unique<stream_session>(provider, std::move(tablet), std::move(connector)),
                attempt_status::succeeded()};
    }

    attempt_status stream_session::start(const std::string& query, int64_t tx_id, const scan_context& ctx) {
        if (!connector_) {
            return attempt_status::fatal_failure("session is closed");
        }
        const auto alias = tablet_alias();
        stream_.reset();
        fields_.clear();
        try {
            auto stream = connector_->stream_execute(query, tx_id, ctx);
            auto first = stream->recv(ctx);
            if (!first) {
                return attempt_status::retryable_failure(
                    "tablet=" + alias + ": stream ended before sending fields for query '" + query + "'");
            }
            fields_ = std::move(first->fields);
            stream_ = std::move(stream);
        } catch (const std::exception& e) {
            return attempt_status::retryable_failure("tablet=" + alias + ": cannot read Fields for query '" + query +
                                                     "': " + e.what());
        }

        scan_stats().streaming_query_started.add(alias);
        return attempt_status::succeeded();
    }

    std::optional<result_batch_t> stream_session::recv(const scan_context& ctx) {
        if (!stream_) {
            throw std::runtime_error("tablet=" + tablet_alias() + ": no streaming query is running");
        }
        try {
            return stream_->recv(ctx);
        } catch (const std::exception& e) {
            throw scan_error(error_kind::TRANSIENT, "tablet=" + tablet_alias() + ": " + e.what());
        }
    }

    void stream_session::close() {
        if (!connector_) {
            return;
        }
        stream_.reset();
        connector_->close();
        connector_.reset();
        fields_.clear();
        provider_->return_tablet(std::move(tablet_));
        tablet_.reset();
    }

} // namespace scan
