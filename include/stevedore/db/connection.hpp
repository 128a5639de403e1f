#pragma once

#include <condition_variable>
#include <cstdlib>
#include <libpq-fe.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stevedore/config.hpp"
#include "stevedore/error.hpp"

namespace stevedore::db {

// Where to connect. Defaults come from SD_DB_*.
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;
    std::string connect_timeout = "10";

    ConnectionConfig() {
        auto env_or = [](const char* name, const char* fallback) -> std::string {
            const char* val = std::getenv(name);
            return val ? val : fallback;
        };
        dbname = env_or("SD_DB_NAME", "postgres");
        host = env_or("SD_DB_HOST", "localhost");
        port = env_or("SD_DB_PORT", "5432");
        user = env_or("SD_DB_USER", "postgres");
        password = env_or("SD_DB_PASS", "");
    }

    // db.* keys of the loaded configuration (env already folded in).
    static ConnectionConfig from_config(const Config& config) {
        ConnectionConfig cc;
        cc.dbname = config.get<std::string>("db.name", cc.dbname);
        cc.host = config.get<std::string>("db.host", cc.host);
        cc.port = config.get<std::string>("db.port", cc.port);
        cc.user = config.get<std::string>("db.user", cc.user);
        cc.password = config.get<std::string>("db.password", cc.password);
        return cc;
    }

    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + dbname;
        if (!host.empty()) conninfo += " host=" + host;
        if (!port.empty()) conninfo += " port=" + port;
        if (!user.empty()) conninfo += " user=" + user;
        if (!password.empty()) conninfo += " password=" + password;
        if (!connect_timeout.empty()) conninfo += " connect_timeout=" + connect_timeout;
        return conninfo;
    }
};

// -d/-h/-p/-U/-W as given on the command line. Only flags that were
// actually passed override the configuration.
struct ConnectionFlags {
    std::optional<std::string> dbname;
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::optional<std::string> user;
    std::optional<std::string> password;

    // Consumes argv[i] and its value when it is a database flag.
    bool parse_arg(int argc, char** argv, int& i) {
        if (i + 1 >= argc) return false;
        std::string arg = argv[i];
        std::optional<std::string>* slot = nullptr;
        if (arg == "-d" || arg == "--dbname") slot = &dbname;
        else if (arg == "-h" || arg == "--host") slot = &host;
        else if (arg == "-p" || arg == "--port") slot = &port;
        else if (arg == "-U" || arg == "--user") slot = &user;
        else if (arg == "-W" || arg == "--password") slot = &password;
        if (!slot) return false;
        *slot = argv[++i];
        return true;
    }

    ConnectionConfig apply(ConnectionConfig base) const {
        if (dbname) base.dbname = *dbname;
        if (host) base.host = *host;
        if (port) base.port = *port;
        if (user) base.user = *user;
        if (password) base.password = *password;
        return base;
    }
};

// Owns one PGconn.
class Connection {
public:
    explicit Connection(const std::string& conninfo) : conn_(PQconnectdb(conninfo.c_str())) {}

    ~Connection() {
        if (conn_) PQfinish(conn_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }

    bool ok() const { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

    const char* error() const { return conn_ ? PQerrorMessage(conn_) : "no connection"; }

private:
    PGconn* conn_;
};

/**
 * Connections shared by the workers of a pool. At most max_size are open;
 * acquire() blocks while all of them are checked out. Connections that went
 * bad are closed on release and replaced lazily.
 */
class ConnectionPool {
public:
    ConnectionPool(const ConnectionConfig& config, size_t max_size)
        : conninfo_(config.to_conninfo()), max_size_(max_size) {}

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Throws DatabaseError(CONNECTION_FAILED) when a new connection cannot be opened.
    std::unique_ptr<Connection> acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !idle_.empty() || open_ < max_size_; });

        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }

        ++open_;
        lock.unlock();
        auto conn = std::make_unique<Connection>(conninfo_);
        if (!conn->ok()) {
            std::string message = std::string("Failed to connect: ") + conn->error();
            lock.lock();
            --open_;
            cv_.notify_one();
            throw DatabaseError(message, "", "ConnectionPool::acquire", ErrorCode::CONNECTION_FAILED);
        }
        return conn;
    }

    void release(std::unique_ptr<Connection> conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn && conn->ok()) {
            idle_.push_back(std::move(conn));
        } else {
            --open_;
        }
        cv_.notify_one();
    }

private:
    const std::string conninfo_;
    const size_t max_size_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Connection>> idle_;
    size_t open_ = 0;
};

// Checks a connection out of the pool for one scope.
class PooledConnection {
public:
    explicit PooledConnection(ConnectionPool& pool) : pool_(pool), conn_(pool.acquire()) {}

    ~PooledConnection() { pool_.release(std::move(conn_)); }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    operator PGconn*() const { return conn_->get(); }

private:
    ConnectionPool& pool_;
    std::unique_ptr<Connection> conn_;
};

} // namespace stevedore::db
