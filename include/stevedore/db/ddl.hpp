/**
 * @file ddl.hpp
 * @brief SQL text for partitioned-table migrations
 *
 * A PartitionSchema describes one range-partitioned parent table and the
 * unconstrained tables that are filled, constrained, indexed and finally
 * attached to it as partitions. The render functions only build strings;
 * execution goes through SqlExecutor.
 *
 * Identifiers are checked against [A-Za-z_][A-Za-z0-9_]* and rejected with
 * InvalidArgumentError. Column and index definitions are configuration text
 * and are passed through as written.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stevedore::db {

struct IndexSpec {
    std::string suffix;      // index is named <table>_<suffix>
    std::string definition;  // text after "ON <table>", e.g. "USING gin (a, b)"
};

struct PartitionSchema {
    std::string parent;
    std::string source_prefix;      // source partition n is <source_prefix><n>
    std::string partition_key;
    std::string copy_key;           // column bounding copy batches
    std::vector<std::string> columns;      // "name TYPE"
    std::vector<std::string> primary_key;
    std::vector<std::string> not_null;
    std::vector<IndexSpec> indexes;

    std::string partition_name(int64_t n) const;
    std::string source_name(int64_t n) const;

    // Throws InvalidArgumentError on the first bad identifier.
    void validate() const;
};

namespace ddl {

bool valid_identifier(const std::string& name);

// Returns name, or throws InvalidArgumentError.
const std::string& identifier(const std::string& name);

std::vector<std::string> create_parent(const PartitionSchema& schema);

// Unconstrained partition with autovacuum disabled; run in one transaction.
std::vector<std::string> create_partition(const PartitionSchema& schema, int64_t n);

std::string disable_autovacuum(const std::string& table);
std::string reset_autovacuum(const std::string& table);

// Rows of from with key in [lo, hi).
std::string copy_rows(const std::string& from, const std::string& to,
                      const std::string& key, int64_t lo, int64_t hi);

std::string constrain(const PartitionSchema& schema, int64_t n, int64_t lo, int64_t hi);

std::string create_index(const PartitionSchema& schema, int64_t n, size_t ordinal);

// Table plus each index; run in one transaction.
std::vector<std::string> attach(const PartitionSchema& schema, int64_t n, int64_t lo, int64_t hi);

std::string drop_range_check(const PartitionSchema& schema, int64_t n);

std::string vacuum_analyze(const std::string& table);

std::string drop_table(const std::string& table);

std::string key_range(const std::string& table, const std::string& column);

} // namespace ddl

} // namespace stevedore::db
