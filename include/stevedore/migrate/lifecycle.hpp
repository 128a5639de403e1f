/**
 * @file lifecycle.hpp
 * @brief Per-partition migration chain
 *
 * Every partition walks the same phases, strictly in order:
 *
 *   autovacuum-disable -> bulk-copy (batches) -> constrain -> build-index
 *   (one per index) -> attach -> drop-range-check -> autovacuum-reset -> analyze
 *
 * Each step is one pool work item; finalize enqueues the next step only
 * after the current one succeeds. Timeouts escalate the deadline (bulk-copy
 * halves its batch first) and errors retry the same step.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "stevedore/db/ddl.hpp"
#include "stevedore/db/executor.hpp"
#include "stevedore/migrate/partition.hpp"
#include "stevedore/pool/pool.hpp"
#include "stevedore/pool/policies.hpp"

namespace stevedore::migrate {

namespace phase {

struct AutovacuumDisable {};

// Copies [cursor, min(cursor + batch, copy_hi)) of the copy key.
struct BulkCopy {
    int64_t cursor = 0;
    int64_t batch = 0;
};

struct Constrain {};

struct BuildIndex {
    size_t ordinal = 0;
};

struct Attach {};
struct DropRangeCheck {};
struct AutovacuumReset {};
struct Analyze {};

} // namespace phase

using Phase = std::variant<
    phase::AutovacuumDisable,
    phase::BulkCopy,
    phase::Constrain,
    phase::BuildIndex,
    phase::Attach,
    phase::DropRangeCheck,
    phase::AutovacuumReset,
    phase::Analyze>;

// Also the name of the counter each successful step increments.
const char* phase_name(const Phase& step);

// Inverse of phase_name; empty for unknown names.
std::optional<Phase> phase_from_name(const std::string& name);

struct LifecycleJob {
    Partition partition;
    Phase phase;
};

// Payload is rows affected.
using LifecycleItem = pool::WorkItem<LifecycleJob, int64_t>;
using LifecycleHandle = pool::PoolHandle<LifecycleItem>;

std::ostream& operator<<(std::ostream& os, const LifecycleJob& job);

class PartitionLifecycle {
public:
    PartitionLifecycle(db::SqlExecutor& executor, db::PartitionSchema schema,
                       pool::RetryPolicy policy, int64_t batch_size);

    LifecycleItem make_item(const Partition& partition, Phase step) const;

    // One autovacuum-disable item per partition.
    std::vector<LifecycleItem> initial(const std::vector<Partition>& partitions) const;

    // Phase that follows a successful job; empty after analyze.
    std::optional<Phase> next_phase(const LifecycleJob& job) const;

    // Worker function.
    int64_t run(const LifecycleItem& item) const;

    pool::Followups<LifecycleItem> finalize(const LifecycleItem& reply,
                                            pool::Signals<LifecycleItem>& signals) const;

    // The lifecycle must outlive the returned handle.
    LifecycleHandle start(int workers, std::vector<LifecycleItem> pending) const;

    const db::PartitionSchema& schema() const { return schema_; }
    const pool::RetryPolicy& policy() const { return policy_; }

private:
    std::optional<pool::Followups<LifecycleItem>> split_batch(const LifecycleItem& reply) const;
    int64_t batch_end(const Partition& partition, const phase::BulkCopy& copy) const;

    db::SqlExecutor& executor_;
    db::PartitionSchema schema_;
    pool::RetryPolicy policy_;
    int64_t batch_size_;
};

} // namespace stevedore::migrate
