#include "stevedore/migrate/tables.hpp"

#include "stevedore/error.hpp"

namespace stevedore::migrate {

namespace {

const char* action_name(TableAction action) {
    return action == TableAction::Create ? "create" : "drop";
}

std::string table_name(const db::PartitionSchema& schema, const TableJob& job) {
    return job.parent ? schema.parent : schema.partition_name(job.number);
}

} // anonymous namespace

std::ostream& operator<<(std::ostream& os, const TableJob& job) {
    os << action_name(job.action) << " ";
    if (job.parent) return os << "parent";
    return os << "partition " << job.number;
}

TableItem make_table_item(const db::PartitionSchema& schema, TableJob job, const pool::RetryPolicy& policy) {
    std::string label = std::string(action_name(job.action)) + ":" + table_name(schema, job);
    return TableItem::make(job, std::move(label), policy.retries, policy.timeout);
}

std::vector<TableItem> plan_tables(const db::PartitionSchema& schema, TableAction action,
                                   int64_t first, int64_t last, const pool::RetryPolicy& policy) {
    STEVEDORE_CHECK_ARGUMENT(first <= last, "partition range is reversed");

    std::vector<TableItem> items;
    items.push_back(make_table_item(schema, TableJob{action, true, 0}, policy));
    for (int64_t n = first; n < last; ++n) {
        items.push_back(make_table_item(schema, TableJob{action, false, n}, policy));
    }
    return items;
}

std::vector<std::string> table_statements(const db::PartitionSchema& schema, const TableJob& job) {
    if (job.action == TableAction::Drop) {
        return {db::ddl::drop_table(table_name(schema, job))};
    }
    if (job.parent) {
        return db::ddl::create_parent(schema);
    }
    return db::ddl::create_partition(schema, job.number);
}

TableHandle start_tables(db::SqlExecutor& executor, const db::PartitionSchema& schema,
                         int workers, std::vector<TableItem> pending, const pool::RetryPolicy& policy) {
    auto work = [&executor, schema](const TableItem& item) {
        auto statements = table_statements(schema, item.job);
        if (statements.size() == 1) {
            executor.execute(statements.front(), item.timeout);
        } else {
            executor.execute_transaction(statements, item.timeout);
        }
        return pool::Unit{};
    };

    auto on_success = [](const TableItem& reply, pool::Signals<TableItem>& signals) {
        signals.count(reply.job.action == TableAction::Create ? "created" : "dropped");
        return pool::Followups<TableItem>::none();
    };

    return pool::Pool<TableJob>::start("tables", workers, std::move(pending), work,
                                       pool::deadline_escalation<TableItem>(policy, on_success));
}

} // namespace stevedore::migrate
