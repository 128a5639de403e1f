#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stevedore/db/connection.hpp"

namespace stevedore::db {

struct KeyRange {
    int64_t min = 0;
    int64_t max = 0;
};

/**
 * Where drivers send their SQL.
 *
 * Every call carries a statement timeout; 0 means no limit. Implementations
 * throw StatementTimeout when the server cancels a statement for running
 * past it and DatabaseError for any other failure.
 */
class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;

    // Returns rows affected.
    virtual int64_t execute(const std::string& sql, std::chrono::milliseconds timeout) = 0;

    // All statements in one transaction; returns total rows affected.
    virtual int64_t execute_transaction(const std::vector<std::string>& statements,
                                        std::chrono::milliseconds timeout) = 0;

    // MIN/MAX of column; empty if the table has no rows.
    virtual std::optional<KeyRange> key_range(const std::string& table, const std::string& column,
                                              std::chrono::milliseconds timeout) = 0;
};

class PgExecutor : public SqlExecutor {
public:
    PgExecutor(const ConnectionConfig& config, size_t max_connections);

    int64_t execute(const std::string& sql, std::chrono::milliseconds timeout) override;

    int64_t execute_transaction(const std::vector<std::string>& statements,
                                std::chrono::milliseconds timeout) override;

    std::optional<KeyRange> key_range(const std::string& table, const std::string& column,
                                      std::chrono::milliseconds timeout) override;

private:
    ConnectionPool pool_;
};

} // namespace stevedore::db
