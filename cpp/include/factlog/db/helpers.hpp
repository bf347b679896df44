/**
 * @file helpers.hpp
 * @brief PostgreSQL result access and statement execution
 *
 * Values cross the libpq boundary as text; typed conversion happens here
 * so that store code never touches PQgetvalue directly.
 */

#pragma once

#include <cstdint>
#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

#include "factlog/error.hpp"

namespace factlog::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

/**
 * Safe extraction of int64 value from PGresult.
 */
inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

/**
 * Safe extraction of boolean value from PGresult.
 * Handles 't'/'f', 'true'/'false', '1'/'0'.
 */
inline bool get_bool(PGresult* res, int row, int col, bool default_val = false) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    return val[0] == 't' || val[0] == 'T' || val[0] == '1';
}

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
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
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }
    int nfields() const { return res_ ? PQnfields(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }
    bool boolean(int row, int col, bool def = false) const { return get_bool(res_, row, col, def); }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const char* sql) {
    return Result(PQexec(conn, sql));
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return exec(conn, sql.c_str());
}

/**
 * Execute a parameterised statement; every parameter is sent as text.
 */
inline Result exec_params(PGconn* conn, const char* sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }
    return Result(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                               values.empty() ? nullptr : values.data(),
                               nullptr, nullptr, 0));
}

/**
 * Execute and require success.
 * @throws StoreUnavailableError carrying the server's message
 */
inline Result exec_checked(PGconn* conn, const char* sql,
                           const std::vector<std::string>& params = {},
                           const char* context = "exec_checked") {
    Result res = params.empty() ? exec(conn, sql) : exec_params(conn, sql, params);
    if (!res.ok()) {
        throw StoreUnavailableError("Statement failed: " + res.error_message(), context);
    }
    return res;
}

/**
 * RAII transaction wrapper. Rolls back unless commit() was called.
 *
 *   {
 *       Transaction tx(conn, "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
 *       exec_checked(conn, "SELECT ...");
 *       tx.commit();
 *   }
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn, const char* begin_sql = "BEGIN")
        : conn_(conn), done_(false) {
        exec_checked(conn_, begin_sql, {}, "Transaction::begin");
    }

    ~Transaction() {
        if (!done_) {
            // Best effort; the connection is released as broken if this fails
            Result res = exec(conn_, "ROLLBACK");
        }
    }

    void commit() {
        if (!done_) {
            done_ = true;
            exec_checked(conn_, "COMMIT", {}, "Transaction::commit");
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool done_;
};

} // namespace factlog::db
