#include "tideline/local_cache.hpp"
#include "tideline/kv_store.hpp"
#include "tideline/log.hpp"

namespace tideline {

nlohmann::json kv_local_cache::load_table(const std::string& table) {
    auto stored = read_json(store_, data_key(table));
    if (!stored || !stored->is_object()) {
        return nlohmann::json::object();
    }
    return std::move(*stored);
}

void kv_local_cache::apply_change(const std::string& table, change_kind kind, const record& row, timestamp_t at) {
    auto id = record_id_of(row);
    if (!id) {
        LOG_WARN("cache", "Ignoring %s for %s: row has no id", to_string(kind), table.c_str());
        return;
    }

    auto rows = load_table(table);
    switch (kind) {
        case change_kind::insert:
        case change_kind::update:
            rows[*id] = row;
            break;
        case change_kind::remove:
            rows.erase(*id);
            break;
    }

    write_json(store_, data_key(table), rows);
    write_json(store_, meta_key(table), nlohmann::json{{"last_updated", format_timestamp(at)}});
    LOG_DEBUG("cache", "Applied %s %s/%s", to_string(kind), table.c_str(), id->c_str());
}

std::optional<record> kv_local_cache::get(const std::string& table, const std::string& record_id) {
    auto rows = load_table(table);
    auto it = rows.find(record_id);
    if (it == rows.end()) return std::nullopt;
    return *it;
}

std::vector<record> kv_local_cache::all(const std::string& table) {
    std::vector<record> result;
    auto rows = load_table(table);
    for (const auto& item : rows.items()) {
        result.push_back(item.value());
    }
    return result;
}

std::optional<timestamp_t> kv_local_cache::last_updated(const std::string& table) {
    auto meta = read_json(store_, meta_key(table));
    if (!meta || !meta->is_object() || !meta->contains("last_updated")) {
        return std::nullopt;
    }
    const auto& value = (*meta)["last_updated"];
    if (!value.is_string()) return std::nullopt;
    return parse_timestamp(value.get<std::string>());
}

void kv_local_cache::clear(const std::string& table) {
    store_.remove(data_key(table));
    store_.remove(meta_key(table));
}

} // namespace tideline
