#include "tideline/kv_store.hpp"
#include "tideline/db.hpp"
#include "tideline/log.hpp"

namespace tideline {

std::optional<nlohmann::json> read_json(kv_store& store, const std::string& key) {
    auto bytes = store.get(key);
    if (!bytes) return std::nullopt;
    try {
        return nlohmann::json::parse(bytes->begin(), bytes->end());
    } catch (const nlohmann::json::exception& e) {
        throw storage_error("Corrupt value for key '" + key + "': " + e.what());
    }
}

void write_json(kv_store& store, const std::string& key, const nlohmann::json& value) {
    auto text = value.dump();
    store.set(key, ByteVector(text.begin(), text.end()));
}

// ============================================================================
// memory_kv_store
// ============================================================================

void memory_kv_store::check_failing() const {
    if (failing_) {
        throw storage_error("memory_kv_store: storage unavailable");
    }
}

std::optional<ByteVector> memory_kv_store::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_failing();
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void memory_kv_store::set(const std::string& key, const ByteVector& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_failing();
    values_[key] = value;
    ++write_count_;
}

void memory_kv_store::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_failing();
    values_.erase(key);
    ++write_count_;
}

// ============================================================================
// sqlite_kv_store
// ============================================================================

sqlite_kv_store::sqlite_kv_store(const std::string& path, std::chrono::milliseconds busy_timeout) {
    try {
        db_ = std::make_unique<database>(path, busy_timeout);
        if (!db_->table_exists("kv_store")) {
            db_->execute(
                "CREATE TABLE kv_store ("
                "key TEXT PRIMARY KEY NOT NULL, "
                "value BLOB NOT NULL, "
                "updated_at TEXT NOT NULL)");
            LOG_DEBUG("kv", "Created kv_store table in %s", path.c_str());
        }
        select_ = std::make_unique<statement>(*db_, "SELECT value FROM kv_store WHERE key = ?");
        upsert_ = std::make_unique<statement>(*db_,
            "INSERT INTO kv_store (key, value, updated_at) VALUES (?, ?, ?) "
            "ON CONFLICT (key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
        delete_ = std::make_unique<statement>(*db_, "DELETE FROM kv_store WHERE key = ?");
        keys_ = std::make_unique<statement>(*db_, "SELECT key FROM kv_store ORDER BY key");
    } catch (const db_error& e) {
        throw storage_error(e.what());
    }
}

sqlite_kv_store::~sqlite_kv_store() = default;

std::optional<ByteVector> sqlite_kv_store::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<ByteVector> value;
    try {
        select_->each({key}, [&](const statement& row) { value = row.column_bytes(0); });
    } catch (const db_error& e) {
        throw storage_error(e.what());
    }
    return value;
}

void sqlite_kv_store::set(const std::string& key, const ByteVector& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        transaction txn(*db_);
        upsert_->run({key, value, format_timestamp(std::chrono::system_clock::now())});
        txn.commit();
    } catch (const db_error& e) {
        throw storage_error(e.what());
    }
}

void sqlite_kv_store::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        delete_->run({key});
    } catch (const db_error& e) {
        throw storage_error(e.what());
    }
}

std::vector<std::string> sqlite_kv_store::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    try {
        keys_->each({}, [&](const statement& row) { result.push_back(row.column_text(0)); });
    } catch (const db_error& e) {
        throw storage_error(e.what());
    }
    return result;
}

} // namespace tideline
