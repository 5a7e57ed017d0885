// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "shard_scan.hpp"

#include "scan/resumable_reader.hpp"
#include "utility/hash_combine.hpp"

namespace fanout {

    std::size_t row_checksum(const scan::row_t& row) {
        std::size_t seed = row.size();
        for (const auto& value : row) {
            hash_fold(seed, scan::hash_value(value));
        }
        return seed;
    }

    shard_scan_response scan_shard_chunk(const shard_scan_request& request, const shard_target& shard) {
        auto log = get_logger(logger_tag::SHARD_FANOUT);

        scan::reader_params params{
            .ctx = request.ctx,
            .provider = shard.provider,
            .table = request.table,
            .chunk = request.chunk,
            .allow_multiple_retries = request.allow_multiple_retries,
            .retry = request.retry,
            .make_connector = request.make_connector,
        };
        auto reader = request.tx_id == 0
                          ? scan::make_resumable_reader(std::move(params))
                          : scan::make_transactional_resumable_reader(std::move(params), request.tx_id);

        shard_scan_response response;
        response.shard = shard.name;
        response.fields = reader->fields();
        while (auto batch = reader->next()) {
            ++response.batches;
            for (const auto& row : batch->rows) {
                hash_fold(response.checksum, row_checksum(row));
                ++response.rows;
            }
        }
        response.last_row = reader->last_row();
        response.tablet_alias = reader->tablet_alias();
        reader->close();

        log->info("shard {}: {} rows in {} batches from tablet {}, chunk {}",
                  shard.name,
                  response.rows,
                  response.batches,
                  response.tablet_alias,
                  request.chunk.to_string());
        return response;
    }

} // namespace fanout
