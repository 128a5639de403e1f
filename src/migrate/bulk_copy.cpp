#include "stevedore/migrate/bulk_copy.hpp"

#include <algorithm>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"

namespace stevedore::migrate {

std::vector<Batch> plan_batches(int64_t lo, int64_t hi, int64_t batch) {
    STEVEDORE_CHECK_ARGUMENT(batch >= 1, "batch size must be at least 1");

    std::vector<Batch> batches;
    for (int64_t start = lo; start < hi;) {
        int64_t end = hi - start <= batch ? hi : start + batch;
        batches.push_back({start, end});
        start = end;
    }
    return batches;
}

// =============================================================================
// Bulk copy
// =============================================================================

std::ostream& operator<<(std::ostream& os, const CopyJob& job) {
    return os << job.from << " -> " << job.to << " " << job.key
              << " [" << job.lo << ", " << job.hi << ")";
}

CopyItem make_copy_item(CopyJob job, const pool::RetryPolicy& policy) {
    std::string label = job.from + "->" + job.to;
    return CopyItem::make(std::move(job), std::move(label), policy.retries, policy.timeout);
}

std::vector<CopyItem> plan_copy(const db::PartitionSchema& schema,
                                const std::vector<Partition>& partitions,
                                int64_t batch, const pool::RetryPolicy& policy) {
    std::vector<CopyItem> items;
    for (const auto& p : partitions) {
        for (const auto& b : plan_batches(p.copy_lo, p.copy_hi, batch)) {
            items.push_back(make_copy_item(
                CopyJob{schema.source_name(p.number), schema.partition_name(p.number),
                        schema.copy_key, b.lo, b.hi},
                policy));
        }
    }
    return items;
}

CopyHandle start_bulk_copy(db::SqlExecutor& executor, int workers,
                           std::vector<CopyItem> pending, const pool::RetryPolicy& policy) {
    auto on_success = [](const CopyItem& reply, pool::Signals<CopyItem>& signals) {
        signals.count("rows:" + reply.job.to, reply.outcome.payload.value_or(0));
        return pool::Followups<CopyItem>::none();
    };

    return pool::Pool<CopyJob, int64_t>::start(
        "bulk-copy", workers, std::move(pending),
        [&executor](const CopyItem& item) {
            const CopyJob& job = item.job;
            LOG_DEBUG("Copying ", job);
            return executor.execute(db::ddl::copy_rows(job.from, job.to, job.key, job.lo, job.hi),
                                    item.timeout);
        },
        pool::range_splitting<CopyItem>(policy, on_success));
}

// =============================================================================
// Partition discovery
// =============================================================================

void DiscoveredPartitions::add(const Partition& p) {
    std::lock_guard<std::mutex> lock(mutex_);
    partitions_.push_back(p);
}

void DiscoveredPartitions::skip(int64_t number) {
    std::lock_guard<std::mutex> lock(mutex_);
    empty_.push_back(number);
}

std::vector<Partition> DiscoveredPartitions::partitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Partition> out(partitions_);
    std::sort(out.begin(), out.end(),
              [](const Partition& a, const Partition& b) { return a.number < b.number; });
    return out;
}

std::vector<int64_t> DiscoveredPartitions::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> out(empty_);
    std::sort(out.begin(), out.end());
    return out;
}

DiscoverHandle start_discovery(db::SqlExecutor& executor, const db::PartitionSchema& schema,
                               int64_t first, int64_t last, int workers,
                               const pool::RetryPolicy& policy,
                               std::shared_ptr<DiscoveredPartitions> out) {
    STEVEDORE_CHECK_ARGUMENT(first <= last, "partition range is reversed");
    STEVEDORE_CHECK_ARGUMENT(out != nullptr, "discovery needs somewhere to put results");

    std::vector<DiscoverItem> pending;
    for (int64_t n = first; n < last; ++n) {
        pending.push_back(DiscoverItem::make(DiscoverJob{n}, "discover:" + schema.source_name(n),
                                             policy.retries, policy.timeout));
    }

    auto work = [&executor, schema](const DiscoverItem& item) -> std::optional<Partition> {
        int64_t n = item.job.number;
        std::string source = schema.source_name(n);

        auto keys = executor.key_range(source, schema.partition_key, item.timeout);
        if (!keys) return std::nullopt;

        Partition p = Partition::make(n, keys->min, keys->max + 1);
        if (schema.copy_key != schema.partition_key) {
            auto copy = executor.key_range(source, schema.copy_key, item.timeout);
            if (copy) {
                p.copy_lo = copy->min;
                p.copy_hi = copy->max + 1;
            }
        }
        return p;
    };

    auto on_success = [out](const DiscoverItem& reply, pool::Signals<DiscoverItem>& signals) {
        const auto& found = *reply.outcome.payload;
        if (found) {
            LOG_DEBUG("Discovered partition ", *found);
            out->add(*found);
            signals.count("discovered");
        } else {
            LOG_INFO("Source partition ", reply.job.number, " is empty, skipping");
            out->skip(reply.job.number);
            signals.count("empty");
        }
        return pool::Followups<DiscoverItem>::none();
    };

    return pool::Pool<DiscoverJob, std::optional<Partition>>::start(
        "discover", workers, std::move(pending), work,
        pool::deadline_escalation<DiscoverItem>(policy, on_success));
}

} // namespace stevedore::migrate
