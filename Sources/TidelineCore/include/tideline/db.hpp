#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace tideline {

using sql_value = std::variant<std::nullptr_t, int64_t, std::string, ByteVector>;

class db_error : public std::runtime_error {
public:
    db_error(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {}

    /// Primary SQLite result code (SQLITE_BUSY, SQLITE_ERROR, ...).
    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

// ============================================================================
// database - One SQLite connection used by a single kv store
// ============================================================================
//
// Writers wait at most busy_timeout for another connection's write lock,
// then fail with SQLITE_BUSY. Callers run on the scheduler thread, so the
// timeout stays short.

class database {
public:
    explicit database(const std::string& path,
                      std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(250));
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name);

    /// Runs parameterless SQL (schema, pragmas, transaction control).
    void execute(const std::string& sql);

    void begin_transaction();
    void commit();
    void rollback();

private:
    friend class statement;

    [[noreturn]] void fail(const std::string& what, int rc) const;

    sqlite3* db_ = nullptr;
};

// ============================================================================
// statement - Prepared once, reset and rebound on every call
// ============================================================================

class statement {
public:
    statement(database& db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// Steps to completion; returns the number of rows changed.
    int run(const std::vector<sql_value>& params = {});

    /// Calls on_row once per result row; column accessors are valid inside it.
    void each(const std::vector<sql_value>& params, const std::function<void(const statement&)>& on_row);

    std::string column_text(int index) const;
    ByteVector column_bytes(int index) const;

private:
    void bind(const std::vector<sql_value>& params);
    void reset() noexcept;

    database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// RAII transaction guard; rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tideline

#endif // __cplusplus
