#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tideline {

class kv_store;

// ============================================================================
// local_cache - Client-side copy of remote rows, updated from pushed changes
// ============================================================================

class local_cache {
public:
    virtual ~local_cache() = default;

    /// Insert/update upsert the row by id; remove erases it.
    /// Throws storage_error if the backing store fails.
    virtual void apply_change(const std::string& table, change_kind kind, const record& row, timestamp_t at) = 0;

    virtual std::optional<record> get(const std::string& table, const std::string& record_id) = 0;

    virtual std::vector<record> all(const std::string& table) = 0;

    virtual std::optional<timestamp_t> last_updated(const std::string& table) = 0;

    /// True if the table was never cached or was last updated more than max_age before now.
    bool is_stale(const std::string& table, std::chrono::milliseconds max_age, timestamp_t now) {
        auto updated = last_updated(table);
        return !updated || (now - *updated) > max_age;
    }
};

// ============================================================================
// kv_local_cache - local_cache persisted through a kv_store
// ============================================================================
//
// Each table is one JSON object keyed by record id under "cache_<table>",
// with its last-updated stamp under "cache_meta_<table>".

class kv_local_cache : public local_cache {
public:
    explicit kv_local_cache(kv_store& store) : store_(store) {}

    void apply_change(const std::string& table, change_kind kind, const record& row, timestamp_t at) override;
    std::optional<record> get(const std::string& table, const std::string& record_id) override;
    std::vector<record> all(const std::string& table) override;
    std::optional<timestamp_t> last_updated(const std::string& table) override;

    /// Drop every cached row and the stamp for table.
    void clear(const std::string& table);

    static std::string data_key(const std::string& table) { return "cache_" + table; }
    static std::string meta_key(const std::string& table) { return "cache_meta_" + table; }

private:
    nlohmann::json load_table(const std::string& table);

    kv_store& store_;
};

} // namespace tideline

#endif // __cplusplus
