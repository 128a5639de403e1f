#include "stevedore/db/executor.hpp"

#include "stevedore/db/ddl.hpp"
#include "stevedore/db/operations.hpp"
#include "stevedore/logging.hpp"

namespace stevedore::db {

namespace {

std::string timeout_setting(std::chrono::milliseconds timeout) {
    return std::to_string(timeout.count());
}

} // anonymous namespace

PgExecutor::PgExecutor(const ConnectionConfig& config, size_t max_connections)
    : pool_(config, max_connections) {}

int64_t PgExecutor::execute(const std::string& sql, std::chrono::milliseconds timeout) {
    PooledConnection conn(pool_);
    exec_checked(conn, "SET statement_timeout = " + timeout_setting(timeout));
    Result res = exec_checked(conn, sql);
    return res.affected();
}

int64_t PgExecutor::execute_transaction(const std::vector<std::string>& statements,
                                        std::chrono::milliseconds timeout) {
    PooledConnection conn(pool_);
    Transaction tx(conn);
    exec_checked(conn, "SET LOCAL statement_timeout = " + timeout_setting(timeout));

    int64_t affected = 0;
    for (const auto& sql : statements) {
        Result res = exec_checked(conn, sql);
        affected += res.affected();
    }
    tx.commit();
    return affected;
}

std::optional<KeyRange> PgExecutor::key_range(const std::string& table, const std::string& column,
                                              std::chrono::milliseconds timeout) {
    std::string sql = ddl::key_range(table, column);

    PooledConnection conn(pool_);
    exec_checked(conn, "SET statement_timeout = " + timeout_setting(timeout));
    Result res = exec_checked(conn, sql);

    if (res.rows() == 0 || res.is_null(0, 0) || res.is_null(0, 1)) {
        LOG_DEBUG(table, ".", column, " is empty");
        return std::nullopt;
    }
    return KeyRange{res.get_int64(0, 0), res.get_int64(0, 1)};
}

} // namespace stevedore::db
