// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "shard_fanout.hpp"

#include "connectors/tablet_connector.hpp"
#include "scan/chunk.hpp"
#include "scan/result_batch.hpp"
#include "scan/retry_config.hpp"
#include "scan/scan_context.hpp"
#include "scan/table_descriptor.hpp"
#include "scan/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fanout {

    // Same chunk, same table, read from every shard.
    struct shard_scan_request {
        scan::scan_context_ptr ctx;
        scan::table_descriptor_ptr table;
        scan::chunk_t chunk;
        bool allow_multiple_retries = true;
        scan::retry_config retry = {};
        int64_t tx_id = 0;
        tablet::connector_factory make_connector = tablet::make_mysql_connector;
    };

    struct shard_scan_response {
        std::string shard;
        std::string tablet_alias;
        std::vector<scan::field_t> fields;
        int64_t rows = 0;
        int64_t batches = 0;
        std::optional<scan::row_t> last_row;
        // Folded row by row in delivery order: two shards holding the same rows in the same key
        // order end up with the same checksum.
        std::size_t checksum = 0;
    };

    std::size_t row_checksum(const scan::row_t& row);

    // Drains a resumable reader over `shard`. Throws whatever the reader throws.
    shard_scan_response scan_shard_chunk(const shard_scan_request& request, const shard_target& shard);

} // namespace fanout
