#pragma once

#include <chrono>
#include <cstdint>

#include "stevedore/config.hpp"
#include "stevedore/db/ddl.hpp"
#include "stevedore/pool/policies.hpp"

namespace stevedore::migrate {

struct RunSettings {
    int workers = 8;
    pool::RetryPolicy policy;
    int64_t batch_size = 100000;
    std::chrono::milliseconds progress_interval{10000};

    // Reads pool.* and copy.* keys. Throws ConfigError on out-of-range values.
    static RunSettings from_config(const Config& config);
};

/**
 * Build the table layout from schema.* keys:
 *
 *   schema.parent        = orders
 *   schema.source_prefix = orders_old_
 *   schema.partition_key = id
 *   schema.copy_key      = id                  (defaults to partition_key)
 *   schema.columns       = id BIGINT; placed_at TIMESTAMPTZ; total NUMERIC(12,2)
 *   schema.primary_key   = id
 *   schema.not_null      = placed_at, total
 *   schema.indexes       = placed, total
 *   schema.index.placed  = USING btree (placed_at)
 *   schema.index.total   = USING btree (total)
 *
 * Columns are ';'-separated so types may contain commas.
 * Throws ConfigError when a required key is missing or an identifier is bad.
 */
db::PartitionSchema schema_from_config(const Config& config);

} // namespace stevedore::migrate
