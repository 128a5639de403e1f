#include "stevedore/db/ddl.hpp"

#include <cctype>
#include <sstream>

#include "stevedore/error.hpp"

namespace stevedore::db {

namespace {

std::string join_identifiers(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += ddl::identifier(names[i]);
    }
    return out;
}

// "name TYPE ..." -> "name"
std::string column_name(const std::string& definition) {
    size_t start = definition.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = definition.find_first_of(" \t", start);
    return definition.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string column_list(const std::vector<std::string>& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        ddl::identifier(column_name(columns[i]));
        out += (i > 0 ? ",\n    " : "\n    ") + columns[i];
    }
    return out;
}

std::string index_name(const std::string& table, const IndexSpec& index) {
    return ddl::identifier(table + "_" + index.suffix);
}

std::string check_name(const std::string& table) {
    return ddl::identifier(table + "_partition_check");
}

} // anonymous namespace

std::string PartitionSchema::partition_name(int64_t n) const {
    return parent + "_partition_" + std::to_string(n);
}

std::string PartitionSchema::source_name(int64_t n) const {
    return source_prefix + std::to_string(n);
}

void PartitionSchema::validate() const {
    ddl::identifier(parent);
    ddl::identifier(partition_key);
    ddl::identifier(copy_key.empty() ? partition_key : copy_key);
    if (!source_prefix.empty()) ddl::identifier(source_name(0));
    STEVEDORE_CHECK_ARGUMENT(!columns.empty(), "schema has no columns");
    for (const auto& c : columns) ddl::identifier(column_name(c));
    for (const auto& c : primary_key) ddl::identifier(c);
    for (const auto& c : not_null) ddl::identifier(c);
    for (const auto& index : indexes) {
        index_name(parent, index);
        STEVEDORE_CHECK_ARGUMENT(!index.definition.empty(), "index " + index.suffix + " has no definition");
    }
}

namespace ddl {

bool valid_identifier(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

const std::string& identifier(const std::string& name) {
    if (!valid_identifier(name)) {
        throw InvalidArgumentError("invalid SQL identifier '" + name + "'", "ddl::identifier",
                                   "identifiers must match [A-Za-z_][A-Za-z0-9_]*");
    }
    return name;
}

std::vector<std::string> create_parent(const PartitionSchema& schema) {
    const std::string& parent = identifier(schema.parent);

    std::ostringstream sql;
    sql << "CREATE TABLE " << parent << " (" << column_list(schema.columns);
    if (!schema.primary_key.empty()) {
        sql << ",\n    PRIMARY KEY (" << join_identifiers(schema.primary_key) << ")";
    }
    sql << "\n) PARTITION BY RANGE (" << identifier(schema.partition_key) << ")";

    std::vector<std::string> statements{sql.str()};
    for (const auto& c : schema.not_null) {
        statements.push_back("ALTER TABLE " + parent + " ALTER COLUMN " + identifier(c) + " SET NOT NULL");
    }
    for (const auto& index : schema.indexes) {
        statements.push_back("CREATE INDEX " + index_name(parent, index) + " ON " + parent + " " + index.definition);
    }
    return statements;
}

std::vector<std::string> create_partition(const PartitionSchema& schema, int64_t n) {
    std::string part = identifier(schema.partition_name(n));
    return {
        "CREATE TABLE " + part + " (" + column_list(schema.columns) + "\n)",
        disable_autovacuum(part),
    };
}

std::string disable_autovacuum(const std::string& table) {
    return "ALTER TABLE " + identifier(table) + " SET (autovacuum_enabled = false)";
}

std::string reset_autovacuum(const std::string& table) {
    return "ALTER TABLE " + identifier(table) + " RESET (autovacuum_enabled)";
}

std::string copy_rows(const std::string& from, const std::string& to,
                      const std::string& key, int64_t lo, int64_t hi) {
    STEVEDORE_CHECK_ARGUMENT(lo < hi, "empty copy range [" + std::to_string(lo) + ", " + std::to_string(hi) + ")");
    return "INSERT INTO " + identifier(to) + " SELECT * FROM " + identifier(from) +
           " WHERE " + identifier(key) + " BETWEEN " + std::to_string(lo) +
           " AND " + std::to_string(hi - 1);
}

std::string constrain(const PartitionSchema& schema, int64_t n, int64_t lo, int64_t hi) {
    std::string part = identifier(schema.partition_name(n));
    const std::string& key = identifier(schema.partition_key);

    std::ostringstream sql;
    sql << "ALTER TABLE " << part;
    const char* sep = "\n    ";
    if (!schema.primary_key.empty()) {
        sql << sep << "ADD PRIMARY KEY (" << join_identifiers(schema.primary_key) << ")";
        sep = ",\n    ";
    }
    for (const auto& c : schema.not_null) {
        sql << sep << "ALTER COLUMN " << identifier(c) << " SET NOT NULL";
        sep = ",\n    ";
    }
    sql << sep << "ADD CONSTRAINT " << check_name(part) << " CHECK ("
        << lo << " <= " << key << " AND " << key << " < " << hi << ")";
    return sql.str();
}

std::string create_index(const PartitionSchema& schema, int64_t n, size_t ordinal) {
    STEVEDORE_CHECK_ARGUMENT(ordinal < schema.indexes.size(), "no index #" + std::to_string(ordinal));
    std::string part = identifier(schema.partition_name(n));
    const auto& index = schema.indexes[ordinal];
    return "CREATE INDEX " + index_name(part, index) + " ON " + part + " " + index.definition;
}

std::vector<std::string> attach(const PartitionSchema& schema, int64_t n, int64_t lo, int64_t hi) {
    const std::string& parent = identifier(schema.parent);
    std::string part = identifier(schema.partition_name(n));

    std::vector<std::string> statements{
        "ALTER TABLE " + parent + " ATTACH PARTITION " + part +
        " FOR VALUES FROM (" + std::to_string(lo) + ") TO (" + std::to_string(hi) + ")"
    };
    for (const auto& index : schema.indexes) {
        statements.push_back("ALTER INDEX " + index_name(parent, index) +
                             " ATTACH PARTITION " + index_name(part, index));
    }
    return statements;
}

std::string drop_range_check(const PartitionSchema& schema, int64_t n) {
    std::string part = identifier(schema.partition_name(n));
    return "ALTER TABLE " + part + " DROP CONSTRAINT " + check_name(part);
}

std::string vacuum_analyze(const std::string& table) {
    return "VACUUM ANALYZE " + identifier(table);
}

std::string drop_table(const std::string& table) {
    return "DROP TABLE IF EXISTS " + identifier(table);
}

std::string key_range(const std::string& table, const std::string& column) {
    const std::string& col = identifier(column);
    return "SELECT MIN(" + col + "), MAX(" + col + ") FROM " + identifier(table);
}

} // namespace ddl

} // namespace stevedore::db
