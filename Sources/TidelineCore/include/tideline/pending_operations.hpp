#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tideline {

class kv_store;

// ============================================================================
// pending_operation - A local mutation not yet applied to the remote store
// ============================================================================

struct pending_operation {
    std::string id;
    std::string table;
    operation_kind kind = operation_kind::create;
    record payload = record::object();
    std::optional<std::string> record_id;  ///< required for update/remove
    timestamp_t queued_at;                  ///< millisecond precision
    int retry_count = 0;

    /// {"id", "table", "operation", "data", "timestamp", "retry_count", "record_id"}
    nlohmann::json to_json() const;

    /// Returns nullopt for entries that are malformed or violate the record id rule.
    static std::optional<pending_operation> from_json(const nlohmann::json& json);

    bool operator==(const pending_operation&) const = default;
};

// ============================================================================
// pending_operation_store - Durable FIFO of pending operations
// ============================================================================
//
// Every mutation is written through to the kv_store under one key as a JSON
// array. Write failures are logged and swallowed: the in-memory list stays
// authoritative for the lifetime of the process.

class pending_operation_store {
public:
    static constexpr const char* default_key = "pending_sync_operations";

    explicit pending_operation_store(kv_store& store, std::string key = default_key);

    pending_operation_store(const pending_operation_store&) = delete;
    pending_operation_store& operator=(const pending_operation_store&) = delete;

    /// Append and persist immediately, even inside a batch. Throws std::invalid_argument for an empty table name
    /// or an update/remove without a record id.
    std::string enqueue(const std::string& table,
                        operation_kind kind,
                        record payload,
                        std::optional<std::string> record_id,
                        timestamp_t now);

    /// Snapshot in insertion order.
    [[nodiscard]] std::vector<pending_operation> list() const { return operations_; }

    [[nodiscard]] std::optional<pending_operation> find(const std::string& id) const;

    /// Returns false if no such operation (no-op).
    bool remove(const std::string& id);

    /// Returns the new retry count, or nullopt if no such operation.
    std::optional<int> increment_retry(const std::string& id);

    void clear();

    [[nodiscard]] size_t size() const noexcept { return operations_.size(); }
    [[nodiscard]] bool empty() const noexcept { return operations_.empty(); }

    /// Mean retry count rounded to the nearest integer (0 when empty).
    [[nodiscard]] int average_retry_count() const;

    /// Write the full list. Returns false (after logging) if the store failed.
    bool persist();

    /// Persist only if a batch left unwritten changes.
    bool flush() { return dirty_ ? persist() : true; }

    /// Replace the in-memory list with the stored one. Returns the number of
    /// operations loaded; unparsable entries are skipped.
    size_t load();

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // RAII guard that coalesces the writes of remove/increment_retry/clear
    // into one persist when the outermost guard is released
    class batch {
    public:
        explicit batch(pending_operation_store& store);
        ~batch();

        batch(const batch&) = delete;
        batch& operator=(const batch&) = delete;

    private:
        pending_operation_store& store_;
    };

private:
    void changed();
    std::string next_id(timestamp_t now);

    kv_store& store_;
    std::string key_;
    std::vector<pending_operation> operations_;
    uint64_t next_sequence_ = 0;
    int batch_depth_ = 0;
    bool dirty_ = false;
};

} // namespace tideline

#endif // __cplusplus
