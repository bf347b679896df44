#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <libpq-fe.h>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <tuple>

#include "factlog/config.hpp"
#include "factlog/error.hpp"

namespace factlog::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname = "factlog";
    std::string host = "localhost";
    std::string port = "5432";
    std::string user = "postgres";
    std::string password;
    int connect_timeout = 5;

    ConnectionConfig() = default;

    // Pull db.* keys from a loaded Config
    static ConnectionConfig from_config(const Config& config) {
        ConnectionConfig cc;
        cc.dbname = config.get<std::string>("db.name", cc.dbname);
        cc.host = config.get<std::string>("db.host", cc.host);
        cc.port = config.get<std::string>("db.port", cc.port);
        cc.user = config.get<std::string>("db.user", cc.user);
        cc.password = config.get<std::string>("db.password", cc.password);
        return cc;
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + quote(dbname);
        if (!host.empty()) conninfo += " host=" + quote(host);
        if (!port.empty()) conninfo += " port=" + quote(port);
        if (!user.empty()) conninfo += " user=" + quote(user);
        if (!password.empty()) conninfo += " password=" + quote(password);
        if (connect_timeout > 0) conninfo += " connect_timeout=" + std::to_string(connect_timeout);
        return conninfo;
    }

    // Parse from command line args (modifies index)
    // Returns false if unknown arg
    bool parse_arg(int argc, char** argv, int& i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--dbname") && i + 1 < argc) {
            dbname = argv[++i];
            return true;
        }
        if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
            return true;
        }
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
            return true;
        }
        if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            user = argv[++i];
            return true;
        }
        if ((arg == "-W" || arg == "--password") && i + 1 < argc) {
            password = argv[++i];
            return true;
        }
        return false;
    }

private:
    // conninfo values with spaces or quotes must be single-quoted
    static std::string quote(const std::string& value) {
        if (!value.empty() && value.find_first_of(" '\\") == std::string::npos) {
            return value;
        }
        std::string out = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        out += "'";
        return out;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

// Bounded connection pool; one connection per concurrent reader
class ConnectionPool {
private:
    std::queue<std::unique_ptr<Connection>> pool_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    const std::string conninfo_;
    size_t max_size_;
    std::atomic<size_t> active_connections_{0};

public:
    /**
     * @brief Create connection pool
     * @param config Database configuration
     * @param max_size Maximum number of connections
     */
    ConnectionPool(const ConnectionConfig& config, size_t max_size = 4)
        : conninfo_(config.to_conninfo()), max_size_(max_size == 0 ? 1 : max_size) {}

    /**
     * @brief Get connection from pool (blocks if none available)
     * @throws StoreUnavailableError if a new connection cannot be opened
     */
    std::unique_ptr<Connection> acquire() {
        std::unique_lock<std::mutex> lock(mutex_);

        while (pool_.empty() && active_connections_.load() >= max_size_) {
            cv_.wait(lock);
        }

        if (!pool_.empty()) {
            auto conn = std::move(pool_.front());
            pool_.pop();
            return conn;
        }

        active_connections_.fetch_add(1);
        lock.unlock();

        auto conn = std::make_unique<Connection>(conninfo_);
        if (!conn->ok()) {
            std::string reason = conn->error();
            active_connections_.fetch_sub(1);
            cv_.notify_one();
            throw StoreUnavailableError("Failed to connect: " + reason, "ConnectionPool::acquire",
                                        "Check FACTLOG_DB_HOST / FACTLOG_DB_PORT and that the server is up");
        }
        return conn;
    }

    /**
     * @brief Return connection to pool
     * @param conn Connection to return (moves ownership)
     */
    void release(std::unique_ptr<Connection> conn) {
        if (!conn || !conn->ok()) {
            // Broken connection, don't reuse
            active_connections_.fetch_sub(1);
            cv_.notify_one();
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

    // (idle, open)
    std::tuple<size_t, size_t> stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {pool_.size(), active_connections_.load()};
    }

    size_t max_size() const { return max_size_; }
};

// RAII wrapper for pooled connections
class PooledConnection {
private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> conn_;

public:
    explicit PooledConnection(ConnectionPool& pool)
        : pool_(&pool), conn_(pool.acquire()) {}

    ~PooledConnection() {
        if (conn_) {
            pool_->release(std::move(conn_));
        }
    }

    // No copy/move - connections must be managed by pool
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&&) = delete;
    PooledConnection& operator=(PooledConnection&&) = delete;

    Connection* operator->() const { return conn_.get(); }
    Connection& operator*() const { return *conn_; }
    PGconn* get() const { return conn_->get(); }
    operator PGconn*() const { return conn_->get(); }
};

} // namespace factlog::db
