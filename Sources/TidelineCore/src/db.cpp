#include "tideline/db.hpp"
#include "tideline/log.hpp"
#include <type_traits>

namespace tideline {

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, std::chrono::milliseconds busy_timeout) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open " + path + ": " + error, rc);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
    try {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA synchronous = NORMAL");
    } catch (const db_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

database::~database() {
    // close_v2 defers the close until any statement still alive is finalized
    sqlite3_close_v2(db_);
}

void database::fail(const std::string& what, int rc) const {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s: %s", what.c_str(), error.c_str());
    throw db_error(what + ": " + error, rc);
}

void database::execute(const std::string& sql) {
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        fail("SQL failed (" + sql + ")", rc);
    }
}

bool database::table_exists(const std::string& name) {
    statement lookup(*this, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    bool exists = false;
    lookup.each({name}, [&](const statement&) { exists = true; });
    return exists;
}

void database::begin_transaction() {
    // Waits up to the busy timeout for another connection's write lock
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

// ============================================================================
// statement
// ============================================================================

statement::statement(database& db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v3(db_.db_, sql.c_str(), -1, SQLITE_PREPARE_PERSISTENT, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        db_.fail("Failed to prepare (" + sql + ")", rc);
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::reset() noexcept {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

void statement::bind(const std::vector<sql_value>& params) {
    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                // An empty vector has no data pointer; bind a zero-length blob, not NULL
                if (v.empty()) return sqlite3_bind_zeroblob(stmt_, index, 0);
                return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            db_.fail("Failed to bind parameter " + std::to_string(index) + " (" + sql_ + ")", rc);
        }
        ++index;
    }
}

int statement::run(const std::vector<sql_value>& params) {
    reset();
    bind(params);
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        // Left for the next call's reset so errmsg still describes this failure
        db_.fail("Execution failed (" + sql_ + ")", rc);
    }
    reset();
    return sqlite3_changes(db_.db_);
}

void statement::each(const std::vector<sql_value>& params, const std::function<void(const statement&)>& on_row) {
    reset();
    bind(params);

    // A statement left mid-iteration would hold its read snapshot open
    struct reset_on_exit {
        statement& self;
        ~reset_on_exit() { self.reset(); }
    } guard{*this};

    int rc;
    while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
        on_row(*this);
    }
    if (rc != SQLITE_DONE) {
        db_.fail("Query failed (" + sql_ + ")", rc);
    }
}

std::string statement::column_text(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    if (!text) return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

ByteVector statement::column_bytes(int index) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
    if (!data) return {};
    return ByteVector(data, data + sqlite3_column_bytes(stmt_, index));
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace tideline
