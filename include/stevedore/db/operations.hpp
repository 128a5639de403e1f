/**
 * @file operations.hpp
 * @brief Statement execution helpers over libpq
 *
 * - Result: RAII owner of a PGresult
 * - exec / exec_checked: run one statement, raising on failure
 * - Transaction: BEGIN on construction, ROLLBACK unless committed
 *
 * Failures raise DatabaseError carrying the server's SQLSTATE; a cancelled
 * statement (SQLSTATE 57014) raises StatementTimeout instead.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <libpq-fe.h>
#include <string>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"

namespace stevedore::db {

// =============================================================================
// Result RAII
// =============================================================================

class Result {
public:
    explicit Result(PGresult* res = nullptr) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        if (!res_) return false;
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
    }

    int rows() const { return res_ ? PQntuples(res_) : 0; }

    // Rows affected by INSERT/UPDATE/DELETE; 0 for everything else.
    int64_t affected() const {
        if (!res_) return 0;
        const char* n = PQcmdTuples(res_);
        if (!n || *n == '\0') return 0;
        return std::stoll(n);
    }

    bool is_null(int row, int col) const {
        return !res_ || row >= PQntuples(res_) || col >= PQnfields(res_) || PQgetisnull(res_, row, col);
    }

    int64_t get_int64(int row, int col) const {
        return std::stoll(PQgetvalue(res_, row, col));
    }

    std::string sqlstate() const {
        if (!res_) return "";
        const char* state = PQresultErrorField(res_, PG_DIAG_SQLSTATE);
        return state ? state : "";
    }

private:
    PGresult* res_;
};

// =============================================================================
// Execution
// =============================================================================

// Translate a failed result into the matching exception.
[[noreturn]] inline void raise_error(PGconn* conn, const Result& res, const std::string& sql) {
    std::string state = res.sqlstate();
    std::string message = res.get() ? PQresultErrorMessage(res.get()) : PQerrorMessage(conn);
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    if (state == StatementTimeout::SQLSTATE) {
        throw StatementTimeout(message, sql);
    }
    throw DatabaseError(message, state, sql);
}

// Run one statement; throws on anything but COMMAND_OK / TUPLES_OK.
inline Result exec_checked(PGconn* conn, const std::string& sql) {
    LOG_DEBUG("SQL: ", sql);
    Result res(PQexec(conn, sql.c_str()));
    if (!res.ok()) {
        raise_error(conn, res, sql);
    }
    return res;
}

// Execute query and report success without throwing
inline bool exec_ok(PGconn* conn, const char* query) {
    Result res(PQexec(conn, query));
    return res.ok();
}

// =============================================================================
// Transaction RAII
// =============================================================================

/**
 * RAII transaction wrapper. Rolls back on exception/early exit.
 *
 * Usage:
 *   {
 *       Transaction tx(conn);
 *       exec_checked(conn, "ALTER TABLE ...");
 *       tx.commit();
 *   }
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), committed_(false) {
        exec_checked(conn_, "BEGIN");
    }

    ~Transaction() {
        if (!committed_) {
            if (!exec_ok(conn_, "ROLLBACK")) {
                LOG_WARN("ROLLBACK failed: ", PQerrorMessage(conn_));
            }
        }
    }

    void commit() {
        if (!committed_) {
            committed_ = true;
            exec_checked(conn_, "COMMIT");
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool committed_;
};

} // namespace stevedore::db
