// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "tablet_connector.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/mysql/column_type.hpp>
#include <boost/mysql/error_with_diagnostics.hpp>
#include <boost/mysql/field_view.hpp>
#include <boost/mysql/metadata.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/rows_view.hpp>

#include <sstream>
#include <stdexcept>
#include <tuple>

namespace tablet {

    namespace {
        // Drives one async operation on `io_ctx` from the calling thread. When the scan context finishes
        // first, the operation gets a terminal cancellation, which leaves the connection unusable.
        template<typename... Results, typename Initiate>
        std::tuple<boost::system::error_code, Results...>
        run_cancellable(asio::io_context& io_ctx, const scan::scan_context& ctx, Initiate&& initiate) {
            asio::cancellation_signal signal;
            std::optional<std::tuple<boost::system::error_code, Results...>> outcome;
            initiate(asio::bind_cancellation_slot(signal.slot(),
                                                  [&outcome](boost::system::error_code ec, Results... results) {
                                                      outcome.emplace(ec, std::move(results)...);
                                                  }));

            bool cancel_requested = false;
            while (!outcome) {
                io_ctx.restart();
                io_ctx.run_for(RECV_POLL_INTERVAL);
                if (!outcome && !cancel_requested && ctx.done()) {
                    signal.emit(asio::cancellation_type::terminal);
                    cancel_requested = true;
                }
            }
            return std::move(*outcome);
        }

        scan::value_t to_value(mysql::field_view field) {
            switch (field.kind()) {
                case mysql::field_kind::null:
                    return {};
                case mysql::field_kind::int64:
                    return field.as_int64();
                case mysql::field_kind::uint64:
                    return field.as_uint64();
                case mysql::field_kind::string:
                    return std::string(field.as_string());
                case mysql::field_kind::blob: {
                    auto blob = field.as_blob();
                    return scan::value_t::bytes(std::string(blob.begin(), blob.end()));
                }
                case mysql::field_kind::float_:
                    return static_cast<double>(field.as_float());
                case mysql::field_kind::double_:
                    return field.as_double();
                default: {
                    // dates and times: ISO text sorts in time order
                    std::ostringstream os;
                    os << field;
                    return os.str();
                }
            }
        }

        std::string type_name(mysql::column_type type) {
            std::ostringstream os;
            os << type;
            return os.str();
        }
    } // namespace

    class Connector::row_stream : public IRowStream {
    public:
        explicit row_stream(Connector& connector)
            : connector_(connector) {}

        std::optional<scan::result_batch_t> recv(const scan::scan_context& ctx) override {
            return connector_.read_batch(ctx);
        }

    private:
        Connector& connector_;
    };

    std::unique_ptr<ITabletConnector> make_mysql_connector(const tablet_handle& tablet) {
        if (!tablet) {
            throw std::invalid_argument("cannot dial an empty tablet handle");
        }
        if (tablet->host.empty()) {
            throw std::invalid_argument("tablet " + tablet->alias + " has no host");
        }
        return std::make_unique<Connector>(tablet);
    }

    Connector::Connector(tablet_handle tablet)
        : log_(get_logger(logger_tag::TABLET_CONNECTOR))
        , tablet_{std::move(tablet)}
        , conn_(io_ctx_)
        , status_{Status::Created} {
        params_.server_address.emplace_host_and_port(tablet_->host, tablet_->port);
        params_.username = tablet_->username;
        params_.password = tablet_->password;
        params_.database = tablet_->database;
        // column names are dropped in the minimal mode
        conn_.set_meta_mode(mysql::metadata_mode::full);
    }

    Connector::~Connector() { close(); }

    Status Connector::status() const noexcept { return status_; }

    std::string Connector::alias() const noexcept { return tablet_->alias; }

    void Connector::close() {
        if (status_ == Status::Closed || status_ == Status::Created) {
            status_ = Status::Closed;
            return;
        }
        log_->debug("[Connector] Alias: {} close connection", tablet_->alias);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.close(ec, diag);
        if (ec) {
            log_->debug("[Connector] Alias: {} close failed: {}", tablet_->alias, ec.message());
        }
        status_ = Status::Closed;
    }

    void Connector::fail(std::string_view operation, const boost::system::error_code& ec) {
        status_ = Status::Disconnected;
        std::string error = "[Connector] Alias: " + tablet_->alias + " " + std::string(operation) +
                            " failed: " + ec.message();
        if (!diag_.server_message().empty()) {
            error += ", server diagnostics: " + std::string(diag_.server_message());
        }
        log_->debug(error);
        throw std::runtime_error(error);
    }

    void Connector::connect(const scan::scan_context& ctx) {
        log_->debug("[Connector] Alias: {} connecting to {}:{}", tablet_->alias, tablet_->host, tablet_->port);
        auto [ec] = run_cancellable(io_ctx_, ctx, [this](auto token) {
            conn_.async_connect(params_, diag_, std::move(token));
        });
        if (ec) {
            fail("connect", ec);
        }
        status_ = Status::Connected;
        snapshot_tx_id_ = 0;
    }

    void Connector::begin_snapshot(int64_t tx_id, const scan::scan_context& ctx) {
        // A MySQL session cannot join a transaction opened elsewhere; the transaction id maps to a
        // consistent-snapshot transaction owned by this connection.
        mysql::results result;
        auto [ec] = run_cancellable(io_ctx_, ctx, [this, &result](auto token) {
            conn_.async_execute(CONSISTENT_SNAPSHOT_QUERY, result, diag_, std::move(token));
        });
        if (ec) {
            fail("start transaction", ec);
        }
        snapshot_tx_id_ = tx_id;
        log_->debug("[Connector] Alias: {} opened snapshot for transaction {}", tablet_->alias, tx_id);
    }

    std::unique_ptr<IRowStream>
    Connector::stream_execute(const std::string& query, int64_t tx_id, const scan::scan_context& ctx) {
        if (status_ == Status::Closed) {
            throw std::runtime_error("[Connector] Alias: " + tablet_->alias + " is closed");
        }
        if (ctx.done()) {
            throw std::runtime_error("[Connector] Alias: " + tablet_->alias + " scan context is already done");
        }
        // a stream that did not run to completion leaves unread rows on the wire: start over
        if (status_ != Status::Connected) {
            connect(ctx);
        }
        if (tx_id != 0 && snapshot_tx_id_ != tx_id) {
            begin_snapshot(tx_id, ctx);
        }

        log_->debug("Alias: {} query: {}", tablet_->alias, query);
        st_ = mysql::execution_state();
        auto [ec] = run_cancellable(io_ctx_, ctx, [this, &query](auto token) {
            conn_.async_start_execution(query, st_, diag_, std::move(token));
        });
        if (ec) {
            fail("start execution [" + query + "]", ec);
        }
        status_ = Status::Streaming;
        fields_sent_ = false;
        return std::make_unique<row_stream>(*this);
    }

    std::optional<scan::result_batch_t> Connector::read_batch(const scan::scan_context& ctx) {
        if (!fields_sent_) {
            scan::result_batch_t batch;
            for (const mysql::metadata& column : st_.meta()) {
                batch.fields.push_back({std::string(column.column_name()), type_name(column.type())});
            }
            fields_sent_ = true;
            return batch;
        }

        while (!st_.complete()) {
            if (status_ != Status::Streaming) {
                throw std::runtime_error("[Connector] Alias: " + tablet_->alias + " has no open stream");
            }
            auto [ec, rows] = run_cancellable<mysql::rows_view>(io_ctx_, ctx, [this](auto token) {
                conn_.async_read_some_rows(st_, diag_, std::move(token));
            });
            if (ec) {
                fail("read rows", ec);
            }
            if (rows.empty()) {
                continue;
            }

            scan::result_batch_t batch;
            batch.rows.reserve(rows.size());
            for (mysql::row_view row : rows) {
                scan::row_t converted;
                converted.reserve(row.size());
                for (mysql::field_view field : row) {
                    converted.push_back(to_value(field));
                }
                batch.rows.push_back(std::move(converted));
            }
            return batch;
        }

        status_ = Status::Connected;
        return std::nullopt;
    }

} // namespace tablet
