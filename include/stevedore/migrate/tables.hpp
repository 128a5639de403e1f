#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "stevedore/db/ddl.hpp"
#include "stevedore/db/executor.hpp"
#include "stevedore/pool/pool.hpp"
#include "stevedore/pool/policies.hpp"

namespace stevedore::migrate {

enum class TableAction { Create, Drop };

struct TableJob {
    TableAction action = TableAction::Create;
    bool parent = false;
    int64_t number = 0;  // partition number, unused for the parent
};

using TableItem = pool::WorkItem<TableJob>;
using TableHandle = pool::PoolHandle<TableItem>;

std::ostream& operator<<(std::ostream& os, const TableJob& job);

TableItem make_table_item(const db::PartitionSchema& schema, TableJob job, const pool::RetryPolicy& policy);

// Parent plus partitions [first, last).
std::vector<TableItem> plan_tables(const db::PartitionSchema& schema, TableAction action,
                                   int64_t first, int64_t last, const pool::RetryPolicy& policy);

// Statements for one job; creating a partition is one transaction.
std::vector<std::string> table_statements(const db::PartitionSchema& schema, const TableJob& job);

// Deadline escalation with bounded retry. Successes count under "created" or "dropped".
// The executor must outlive the returned handle.
TableHandle start_tables(db::SqlExecutor& executor, const db::PartitionSchema& schema,
                         int workers, std::vector<TableItem> pending, const pool::RetryPolicy& policy);

} // namespace stevedore::migrate
