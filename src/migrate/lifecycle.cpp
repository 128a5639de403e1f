#include "stevedore/migrate/lifecycle.hpp"

#include <type_traits>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"

namespace stevedore::migrate {

namespace {

template<typename>
inline constexpr bool always_false = false;

} // anonymous namespace

const char* phase_name(const Phase& step) {
    return std::visit([](const auto& p) -> const char* {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, phase::AutovacuumDisable>) return "autovacuum-disable";
        else if constexpr (std::is_same_v<T, phase::BulkCopy>) return "bulk-copy";
        else if constexpr (std::is_same_v<T, phase::Constrain>) return "constrain";
        else if constexpr (std::is_same_v<T, phase::BuildIndex>) return "build-index";
        else if constexpr (std::is_same_v<T, phase::Attach>) return "attach";
        else if constexpr (std::is_same_v<T, phase::DropRangeCheck>) return "drop-range-check";
        else if constexpr (std::is_same_v<T, phase::AutovacuumReset>) return "autovacuum-reset";
        else if constexpr (std::is_same_v<T, phase::Analyze>) return "analyze";
        else static_assert(always_false<T>, "unhandled phase");
    }, step);
}

std::optional<Phase> phase_from_name(const std::string& name) {
    if (name == "autovacuum-disable") return Phase{phase::AutovacuumDisable{}};
    if (name == "bulk-copy") return Phase{phase::BulkCopy{}};
    if (name == "constrain") return Phase{phase::Constrain{}};
    if (name == "build-index") return Phase{phase::BuildIndex{}};
    if (name == "attach") return Phase{phase::Attach{}};
    if (name == "drop-range-check") return Phase{phase::DropRangeCheck{}};
    if (name == "autovacuum-reset") return Phase{phase::AutovacuumReset{}};
    if (name == "analyze") return Phase{phase::Analyze{}};
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const LifecycleJob& job) {
    os << job.partition << " " << phase_name(job.phase);
    if (auto* copy = std::get_if<phase::BulkCopy>(&job.phase)) {
        os << " @" << copy->cursor << "+" << copy->batch;
    } else if (auto* index = std::get_if<phase::BuildIndex>(&job.phase)) {
        os << " #" << index->ordinal;
    }
    return os;
}

PartitionLifecycle::PartitionLifecycle(db::SqlExecutor& executor, db::PartitionSchema schema,
                                       pool::RetryPolicy policy, int64_t batch_size)
    : executor_(executor)
    , schema_(std::move(schema))
    , policy_(policy)
    , batch_size_(batch_size) {
    STEVEDORE_CHECK_ARGUMENT(batch_size_ >= 1, "batch size must be at least 1");
    schema_.validate();
}

LifecycleItem PartitionLifecycle::make_item(const Partition& partition, Phase step) const {
    std::string label = schema_.partition_name(partition.number) + ":" + phase_name(step);
    if (auto* index = std::get_if<phase::BuildIndex>(&step)) {
        if (index->ordinal < schema_.indexes.size()) {
            label += ":" + schema_.indexes[index->ordinal].suffix;
        }
    }
    return LifecycleItem::make(LifecycleJob{partition, step}, std::move(label),
                               policy_.retries, policy_.timeout);
}

std::vector<LifecycleItem> PartitionLifecycle::initial(const std::vector<Partition>& partitions) const {
    std::vector<LifecycleItem> items;
    items.reserve(partitions.size());
    for (const auto& p : partitions) {
        items.push_back(make_item(p, phase::AutovacuumDisable{}));
    }
    return items;
}

int64_t PartitionLifecycle::batch_end(const Partition& partition, const phase::BulkCopy& copy) const {
    if (partition.copy_hi - copy.cursor <= copy.batch) return partition.copy_hi;
    return copy.cursor + copy.batch;
}

std::optional<Phase> PartitionLifecycle::next_phase(const LifecycleJob& job) const {
    const Partition& part = job.partition;

    auto after_copy = []() -> Phase {
        return phase::Constrain{};
    };
    auto after_constrain = [this]() -> Phase {
        if (schema_.indexes.empty()) return phase::Attach{};
        return phase::BuildIndex{0};
    };

    return std::visit([&](const auto& p) -> std::optional<Phase> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, phase::AutovacuumDisable>) {
            if (part.copy_lo >= part.copy_hi) return after_copy();
            return Phase{phase::BulkCopy{part.copy_lo, batch_size_}};
        } else if constexpr (std::is_same_v<T, phase::BulkCopy>) {
            int64_t end = batch_end(part, p);
            if (end >= part.copy_hi) return after_copy();
            return Phase{phase::BulkCopy{end, batch_size_}};
        } else if constexpr (std::is_same_v<T, phase::Constrain>) {
            return after_constrain();
        } else if constexpr (std::is_same_v<T, phase::BuildIndex>) {
            if (p.ordinal + 1 < schema_.indexes.size()) return Phase{phase::BuildIndex{p.ordinal + 1}};
            return Phase{phase::Attach{}};
        } else if constexpr (std::is_same_v<T, phase::Attach>) {
            return Phase{phase::DropRangeCheck{}};
        } else if constexpr (std::is_same_v<T, phase::DropRangeCheck>) {
            return Phase{phase::AutovacuumReset{}};
        } else if constexpr (std::is_same_v<T, phase::AutovacuumReset>) {
            return Phase{phase::Analyze{}};
        } else if constexpr (std::is_same_v<T, phase::Analyze>) {
            return std::nullopt;
        } else {
            static_assert(always_false<T>, "unhandled phase");
        }
    }, job.phase);
}

int64_t PartitionLifecycle::run(const LifecycleItem& item) const {
    const Partition& part = item.job.partition;
    const std::string table = schema_.partition_name(part.number);
    const auto timeout = item.timeout;

    return std::visit([&](const auto& p) -> int64_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, phase::AutovacuumDisable>) {
            return executor_.execute(db::ddl::disable_autovacuum(table), timeout);
        } else if constexpr (std::is_same_v<T, phase::BulkCopy>) {
            std::string sql = db::ddl::copy_rows(schema_.source_name(part.number), table,
                                                 schema_.copy_key, p.cursor, batch_end(part, p));
            return executor_.execute(sql, timeout);
        } else if constexpr (std::is_same_v<T, phase::Constrain>) {
            return executor_.execute(db::ddl::constrain(schema_, part.number, part.lo, part.hi), timeout);
        } else if constexpr (std::is_same_v<T, phase::BuildIndex>) {
            return executor_.execute(db::ddl::create_index(schema_, part.number, p.ordinal), timeout);
        } else if constexpr (std::is_same_v<T, phase::Attach>) {
            return executor_.execute_transaction(db::ddl::attach(schema_, part.number, part.lo, part.hi), timeout);
        } else if constexpr (std::is_same_v<T, phase::DropRangeCheck>) {
            return executor_.execute(db::ddl::drop_range_check(schema_, part.number), timeout);
        } else if constexpr (std::is_same_v<T, phase::AutovacuumReset>) {
            return executor_.execute(db::ddl::reset_autovacuum(table), timeout);
        } else if constexpr (std::is_same_v<T, phase::Analyze>) {
            return executor_.execute(db::ddl::vacuum_analyze(table), timeout);
        } else {
            static_assert(always_false<T>, "unhandled phase");
        }
    }, item.job.phase);
}

// A timed-out copy batch wider than one key is retried at half the width.
std::optional<pool::Followups<LifecycleItem>> PartitionLifecycle::split_batch(const LifecycleItem& reply) const {
    const auto* copy = std::get_if<phase::BulkCopy>(&reply.job.phase);
    if (!copy) return std::nullopt;

    int64_t width = batch_end(reply.job.partition, *copy) - copy->cursor;
    if (width <= 1) return std::nullopt;

    LifecycleItem next = reply.followup();
    next.job.phase = phase::BulkCopy{copy->cursor, width / 2};
    LOG_DEBUG("Halving batch of ", reply.label, " to ", width / 2);
    return pool::Followups<LifecycleItem>::retry(std::move(next));
}

pool::Followups<LifecycleItem> PartitionLifecycle::finalize(const LifecycleItem& reply,
                                                            pool::Signals<LifecycleItem>& signals) const {
    if (reply.succeeded()) {
        signals.count(phase_name(reply.job.phase));
        if (std::holds_alternative<phase::BulkCopy>(reply.job.phase)) {
            signals.count("rows:" + schema_.partition_name(reply.job.partition.number),
                          reply.outcome.payload.value_or(0));
        }

        auto next = next_phase(reply.job);
        if (!next) {
            LOG_INFO("Partition ", schema_.partition_name(reply.job.partition.number), " done");
            return pool::Followups<LifecycleItem>::none();
        }
        return pool::Followups<LifecycleItem>::retry(make_item(reply.job.partition, *next));
    }

    if (reply.timed_out()) {
        if (auto halved = split_batch(reply)) return std::move(*halved);
    }
    return pool::escalate_or_retry(reply, policy_);
}

LifecycleHandle PartitionLifecycle::start(int workers, std::vector<LifecycleItem> pending) const {
    return pool::Pool<LifecycleJob, int64_t>::start(
        "lifecycle", workers, std::move(pending),
        [this](const LifecycleItem& item) { return run(item); },
        [this](const LifecycleItem& reply, pool::Signals<LifecycleItem>& signals) {
            return finalize(reply, signals);
        });
}

} // namespace stevedore::migrate
