#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "stevedore/db/ddl.hpp"
#include "stevedore/db/executor.hpp"
#include "stevedore/migrate/partition.hpp"
#include "stevedore/pool/pool.hpp"
#include "stevedore/pool/policies.hpp"

namespace stevedore::migrate {

struct Batch {
    int64_t lo = 0;
    int64_t hi = 0;

    bool operator==(const Batch& o) const { return lo == o.lo && hi == o.hi; }
};

// Disjoint, contiguous batches of at most `batch` keys covering [lo, hi).
std::vector<Batch> plan_batches(int64_t lo, int64_t hi, int64_t batch);

// =============================================================================
// Bulk copy
// =============================================================================

// Copy rows of `from` whose `key` lies in [lo, hi) into `to`.
struct CopyJob {
    std::string from;
    std::string to;
    std::string key;
    int64_t lo = 0;
    int64_t hi = 0;
};

// Payload is rows copied.
using CopyItem = pool::WorkItem<CopyJob, int64_t>;
using CopyHandle = pool::PoolHandle<CopyItem>;

std::ostream& operator<<(std::ostream& os, const CopyJob& job);

CopyItem make_copy_item(CopyJob job, const pool::RetryPolicy& policy);

// One item per batch of each partition's copy range, from source to target.
std::vector<CopyItem> plan_copy(const db::PartitionSchema& schema,
                                const std::vector<Partition>& partitions,
                                int64_t batch, const pool::RetryPolicy& policy);

// Range-splitting pool; rows copied are counted under "rows:<target>".
// The executor must outlive the returned handle.
CopyHandle start_bulk_copy(db::SqlExecutor& executor, int workers,
                           std::vector<CopyItem> pending, const pool::RetryPolicy& policy);

// =============================================================================
// Partition discovery
// =============================================================================

struct DiscoverJob {
    int64_t number = 0;
};

// Empty payload: the source partition has no rows.
using DiscoverItem = pool::WorkItem<DiscoverJob, std::optional<Partition>>;
using DiscoverHandle = pool::PoolHandle<DiscoverItem>;

// Partitions found by a discovery pool, filled in by its supervisor.
class DiscoveredPartitions {
public:
    void add(const Partition& p);
    void skip(int64_t number);

    // Sorted by partition number.
    std::vector<Partition> partitions() const;
    std::vector<int64_t> empty() const;

private:
    std::vector<Partition> partitions_;
    std::vector<int64_t> empty_;
    mutable std::mutex mutex_;
};

/**
 * Query MIN/MAX of the partition key and the copy key of source partitions
 * [first, last) to learn each partition's bounds. Results accumulate in
 * `out`; read it after the pool has joined.
 */
DiscoverHandle start_discovery(db::SqlExecutor& executor, const db::PartitionSchema& schema,
                               int64_t first, int64_t last, int workers,
                               const pool::RetryPolicy& policy,
                               std::shared_ptr<DiscoveredPartitions> out);

} // namespace stevedore::migrate
