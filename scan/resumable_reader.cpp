// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "resumable_reader.hpp"

#include "query_generation/scan_query_generator.hpp"
#include "utility/scan_stats.hpp"

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>

namespace scan {

    namespace {
        double seconds_since(scan_context::clock::time_point start) {
            return std::chrono::duration<double>(scan_context::clock::now() - start).count();
        }
    } // namespace

    const std::vector<field_t> resumable_reader::no_fields_{};

    resumable_reader::resumable_reader(reader_params params, int64_t tx_id)
        : log_(get_logger(logger_tag::RESUMABLE_READER))
        , ctx_(std::move(params.ctx))
        , provider_(std::move(params.provider))
        , table_(std::move(params.table))
        , chunk_(std::move(params.chunk))
        , allow_multiple_retries_(params.allow_multiple_retries)
        , retry_(params.retry)
        , make_connector_(std::move(params.make_connector))
        , tx_id_(tx_id) {
        if (!ctx_ || !provider_ || !table_ || !make_connector_) {
            throw std::invalid_argument("resumable reader needs a context, a tablet provider, a table and a dialer");
        }
        validate(*table_);
        if (table_->primary_key_columns.empty()) {
            throw std::invalid_argument("table '" + table_->name + "' has no primary key, its scan cannot be resumed");
        }
        try_to_connect();
    }

    resumable_reader::~resumable_reader() { close(); }

    void resumable_reader::try_to_connect() {
        // A failed initial connection is retried once; the retry is the second attempt.
        for (int attempt = 1;; ++attempt) {
            auto status = replace_session();
            if (status.ok()) {
                status = start_stream(*ctx_);
            }
            if (status.ok()) {
                state_ = reader_state::STREAMING;
                return;
            }

            if (!status.retryable() || attempt > 1) {
                close();
                throw scan_error(error_kind::INIT_FAILED,
                                 fmt::format("failed to initialize tablet connection: retryable {}: {}",
                                             status.retryable(),
                                             status.error));
            }
            ++scan_stats().retry_count;
            log_->info("retrying after error: {}", status.error);
        }
    }

    attempt_status resumable_reader::replace_session() {
        // the previous tablet goes back to the provider before a new one is requested
        if (session_) {
            session_->close();
            session_.reset();
        }
        auto [session, status] = stream_session::open(provider_, make_connector_);
        session_ = std::move(session);
        return status;
    }

    attempt_status resumable_reader::start_stream(const scan_context& ctx) {
        query_ = sql_gen::generate_scan_query(*table_, chunk_, last_row_);
        auto status = session_->start(query_, tx_id_, ctx);
        if (status.ok()) {
            log_->debug("tablet={} table={} chunk={}: Starting to stream rows using query '{}'.",
                        session_->tablet_alias(),
                        table_->name,
                        chunk_.to_string(),
                        query_);
        }
        return status;
    }

    std::optional<result_batch_t> resumable_reader::next() {
        if (state_ == reader_state::CLOSED) {
            throw scan_error(error_kind::FATAL,
                             fmt::format("table={} chunk={}: reader is closed", table_->name, chunk_.to_string()));
        }
        if (state_ == reader_state::FAILED) {
            throw scan_error(error_kind::FATAL,
                             fmt::format("table={} chunk={}: reader failed before", table_->name, chunk_.to_string()));
        }

        std::string error;
        try {
            auto batch = session_->recv(*ctx_);
            remember_last_row(batch);
            return batch;
        } catch (const std::exception& e) {
            error = e.what();
        }

        const auto alias = session_->tablet_alias();
        scan_stats().streaming_query_errors.add(alias);
        log_->debug("tablet={} table={} chunk={}: Failed to read next rows from active streaming query. Trying "
                    "to restart stream on the same tablet. Original Error: {}",
                    alias,
                    table_->name,
                    chunk_.to_string(),
                    error);

        auto batch = next_with_retries(std::move(error));
        remember_last_row(batch);
        return batch;
    }

    std::optional<result_batch_t> resumable_reader::next_with_retries(std::string error) {
        state_ = reader_state::RETRYING;
        auto retry_ctx = scan_context::with_timeout(ctx_, retry_.retry_budget);
        const auto start = scan_context::clock::now();

        // The failed receive in next() was the first attempt.
        for (int attempt = 2;; ++attempt) {
            ++scan_stats().retry_count;
            auto result = run_retry_attempt(attempt, *retry_ctx);
            if (result.status.ok()) {
                const auto alias = tablet_alias();
                log_->debug("tablet={} table={} chunk={}: Successfully restarted streaming query with query '{}' "
                            "after {:.1f} seconds.",
                            alias,
                            table_->name,
                            chunk_.to_string(),
                            query_,
                            seconds_since(start));
                if (attempt == 2) {
                    scan_stats().restarts_same_tablet.add(alias);
                } else {
                    ++scan_stats().restarts_different_tablet;
                }
                state_ = reader_state::STREAMING;
                return std::move(result.batch);
            }

            error = std::move(result.status.error);
            if (!result.status.retryable()) {
                fail(error_kind::FATAL,
                     fmt::format("table={} chunk={}: failed to restart streaming query (attempt {}) due to a "
                                 "non-retryable error: {}",
                                 table_->name,
                                 chunk_.to_string(),
                                 attempt,
                                 error));
            }

            if (retry_ctx->done()) {
                break;
            }

            if (attempt == 2 && !allow_multiple_retries_) {
                fail(error_kind::BUDGET_EXHAUSTED,
                     fmt::format("{}: first retry to restart the streaming query on the same tablet failed. We're "
                                 "failing at this point because we're not allowed to keep retrying. err: {}",
                                 provider_->description(),
                                 error));
            }

            if (session_) {
                // no session when the provider had no tablet for us
                scan_stats().streaming_query_errors.add(session_->tablet_alias());
            }
            log_->debug("tablet={} table={} chunk={}: Failed to restart streaming query (attempt {}) with query "
                        "'{}'. Retrying to restart stream on a different tablet (for up to {:.1f} minutes). Next "
                        "retry is in {:.1f} seconds. Error: {}",
                        tablet_alias(),
                        table_->name,
                        chunk_.to_string(),
                        attempt,
                        query_,
                        std::chrono::duration<double, std::ratio<60>>(retry_ctx->time_left()).count(),
                        std::chrono::duration<double>(retry_.backoff_interval).count(),
                        error);

            // backoff
            if (!retry_ctx->wait_for(retry_.backoff_interval)) {
                break;
            }
        }

        if (retry_ctx->error() == context_error::CANCELLED) {
            fail(error_kind::CANCELLED,
                 fmt::format("{}: interrupted while trying to restart the streaming connection ({:.1f} minutes "
                             "elapsed so far). Last error: {}",
                             provider_->description(),
                             seconds_since(start) / 60.0,
                             error));
        }
        fail(error_kind::DEADLINE_EXCEEDED,
             fmt::format("{}: failed to restart the streaming connection after retrying for {:.1f} seconds. Last "
                         "error: {}",
                         provider_->description(),
                         seconds_since(start),
                         error));
    }

    resumable_reader::retry_attempt resumable_reader::run_retry_attempt(int attempt, const scan_context& ctx) {
        if (attempt > 2) {
            // No failover at the 2nd attempt: the first restart is meant for problems which go away on
            // their own, e.g. the server killing the connection after net_write_timeout.
            auto status = replace_session();
            if (!status.ok()) {
                return {std::move(status), std::nullopt};
            }
        }

        auto status = start_stream(ctx);
        if (!status.ok()) {
            return {std::move(status), std::nullopt};
        }

        try {
            return {attempt_status::succeeded(), session_->recv(ctx)};
        } catch (const std::exception& e) {
            return {attempt_status::retryable_failure(e.what()), std::nullopt};
        }
    }

    void resumable_reader::fail(error_kind kind, const std::string& message) {
        state_ = reader_state::FAILED;
        log_->error(message);
        throw scan_error(kind, message);
    }

    void resumable_reader::remember_last_row(const std::optional<result_batch_t>& batch) {
        if (!batch || batch->rows.empty()) {
            return;
        }
        const auto& row = batch->rows.back();
        const auto key_columns = table_->primary_key_columns.size();
        if (row.size() < key_columns) {
            fail(error_kind::FATAL,
                 fmt::format("table={}: row {} has fewer values than the {} primary key columns",
                             table_->name,
                             to_string(row),
                             key_columns));
        }
        if (last_row_ && !tuple_greater(row, *last_row_, key_columns)) {
            log_->warn("table={} chunk={}: row {} does not sort after the previous last row {}",
                       table_->name,
                       chunk_.to_string(),
                       to_string(row),
                       to_string(*last_row_));
        }
        last_row_ = row;
    }

    const std::vector<field_t>& resumable_reader::fields() const { return session_ ? session_->fields() : no_fields_; }

    std::string resumable_reader::tablet_alias() const { return session_ ? session_->tablet_alias() : "unknown"; }

    void resumable_reader::close() {
        if (session_) {
            session_->close();
            session_.reset();
        }
        state_ = reader_state::CLOSED;
    }

    std::unique_ptr<resumable_reader> make_resumable_reader(reader_params params) {
        return std::make_unique<resumable_reader>(std::move(params));
    }

    std::unique_ptr<resumable_reader> make_transactional_resumable_reader(reader_params params, int64_t tx_id) {
        if (tx_id == 0) {
            throw std::invalid_argument("transactional reader needs a non-zero transaction id");
        }
        return std::make_unique<resumable_reader>(std::move(params), tx_id);
    }

} // namespace scan
