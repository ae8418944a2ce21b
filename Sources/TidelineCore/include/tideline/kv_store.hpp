#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <chrono>

namespace tideline {

class database;
class statement;

class storage_error : public std::runtime_error {
public:
    explicit storage_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// kv_store - Durable key/value storage for serialized queues and caches
// ============================================================================

class kv_store {
public:
    virtual ~kv_store() = default;

    /// Returns nullopt if the key has never been written (or was removed).
    virtual std::optional<ByteVector> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const ByteVector& value) = 0;

    virtual void remove(const std::string& key) = 0;
};

/// Convenience helpers for the JSON documents every component stores.
std::optional<nlohmann::json> read_json(kv_store& store, const std::string& key);
void write_json(kv_store& store, const std::string& key, const nlohmann::json& value);

// ============================================================================
// memory_kv_store - Process-lifetime storage
// ============================================================================

class memory_kv_store : public kv_store {
public:
    std::optional<ByteVector> get(const std::string& key) override;
    void set(const std::string& key, const ByteVector& value) override;
    void remove(const std::string& key) override;

    /// Make every subsequent get/set/remove throw storage_error.
    void set_failing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    [[nodiscard]] size_t write_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return write_count_;
    }

private:
    void check_failing() const;

    mutable std::mutex mutex_;
    std::map<std::string, ByteVector> values_;
    bool failing_ = false;
    size_t write_count_ = 0;
};

// ============================================================================
// sqlite_kv_store - kv_store backed by a single SQLite table
// ============================================================================

class sqlite_kv_store : public kv_store {
public:
    /// Opens (or creates) the database at path. Use ":memory:" for an in-process store.
    /// Writes give up with storage_error after busy_timeout if another connection holds the lock.
    explicit sqlite_kv_store(const std::string& path,
                             std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(250));
    ~sqlite_kv_store() override;

    sqlite_kv_store(const sqlite_kv_store&) = delete;
    sqlite_kv_store& operator=(const sqlite_kv_store&) = delete;

    std::optional<ByteVector> get(const std::string& key) override;
    void set(const std::string& key, const ByteVector& value) override;
    void remove(const std::string& key) override;

    /// All stored keys, in lexical order.
    std::vector<std::string> keys();

private:
    std::unique_ptr<database> db_;
    std::unique_ptr<statement> select_;
    std::unique_ptr<statement> upsert_;
    std::unique_ptr<statement> delete_;
    std::unique_ptr<statement> keys_;
    std::mutex mutex_;
};

} // namespace tideline

#endif // __cplusplus
