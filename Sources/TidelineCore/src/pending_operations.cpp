#include "tideline/pending_operations.hpp"
#include "tideline/kv_store.hpp"
#include "tideline/log.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tideline {

nlohmann::json pending_operation::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["table"] = table;
    j["operation"] = to_string(kind);
    j["data"] = payload;
    j["timestamp"] = format_timestamp(queued_at);
    j["retry_count"] = retry_count;
    j["record_id"] = record_id ? nlohmann::json(*record_id) : nlohmann::json(nullptr);
    return j;
}

std::optional<pending_operation> pending_operation::from_json(const nlohmann::json& json) {
    if (!json.is_object()) return std::nullopt;

    auto string_field = [&](const char* name) -> std::optional<std::string> {
        auto it = json.find(name);
        if (it == json.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };

    auto id = string_field("id");
    auto table = string_field("table");
    auto kind_name = string_field("operation");
    auto timestamp = string_field("timestamp");
    if (!id || !table || !kind_name || !timestamp) return std::nullopt;

    auto kind = parse_operation_kind(*kind_name);
    auto queued_at = parse_timestamp(*timestamp);
    if (!kind || !queued_at) return std::nullopt;

    pending_operation op;
    op.id = *id;
    op.table = *table;
    op.kind = *kind;
    op.queued_at = *queued_at;
    op.record_id = string_field("record_id");

    if (auto it = json.find("data"); it != json.end() && !it->is_null()) {
        op.payload = *it;
    }
    if (auto it = json.find("retry_count"); it != json.end() && it->is_number_integer()) {
        op.retry_count = std::max(0, it->get<int>());
    }

    if (requires_record_id(op.kind) && !op.record_id) return std::nullopt;
    return op;
}

// ============================================================================
// pending_operation_store
// ============================================================================

pending_operation_store::pending_operation_store(kv_store& store, std::string key)
    : store_(store), key_(std::move(key)) {}

std::string pending_operation_store::next_id(timestamp_t now) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "sync_" + std::to_string(ms) + "_" + std::to_string(next_sequence_++);
}

std::string pending_operation_store::enqueue(const std::string& table,
                                             operation_kind kind,
                                             record payload,
                                             std::optional<std::string> record_id,
                                             timestamp_t now) {
    if (table.empty()) {
        throw std::invalid_argument("Pending operation requires a table name");
    }
    if (requires_record_id(kind) && (!record_id || record_id->empty())) {
        throw std::invalid_argument(std::string("Record ID required for ") + to_string(kind) + " operation");
    }

    pending_operation op;
    op.id = next_id(now);
    op.table = table;
    op.kind = kind;
    op.payload = payload.is_null() ? record::object() : std::move(payload);
    op.record_id = std::move(record_id);
    op.queued_at = truncate_to_millis(now);
    op.retry_count = 0;

    operations_.push_back(op);
    LOG_INFO("pending_ops", "Queued %s operation for %s: %s", to_string(kind), table.c_str(), op.id.c_str());
    persist();
    return op.id;
}

std::optional<pending_operation> pending_operation_store::find(const std::string& id) const {
    auto it = std::find_if(operations_.begin(), operations_.end(),
                           [&](const pending_operation& op) { return op.id == id; });
    if (it == operations_.end()) return std::nullopt;
    return *it;
}

bool pending_operation_store::remove(const std::string& id) {
    auto removed = std::erase_if(operations_, [&](const pending_operation& op) { return op.id == id; });
    if (removed == 0) return false;
    changed();
    return true;
}

std::optional<int> pending_operation_store::increment_retry(const std::string& id) {
    for (auto& op : operations_) {
        if (op.id == id) {
            ++op.retry_count;
            changed();
            return op.retry_count;
        }
    }
    return std::nullopt;
}

void pending_operation_store::clear() {
    operations_.clear();
    changed();
}

int pending_operation_store::average_retry_count() const {
    if (operations_.empty()) return 0;
    long total = 0;
    for (const auto& op : operations_) total += op.retry_count;
    return static_cast<int>(std::lround(static_cast<double>(total) / static_cast<double>(operations_.size())));
}

void pending_operation_store::changed() {
    if (batch_depth_ > 0) {
        dirty_ = true;
        return;
    }
    persist();
}

bool pending_operation_store::persist() {
    dirty_ = false;
    auto array = nlohmann::json::array();
    for (const auto& op : operations_) {
        array.push_back(op.to_json());
    }
    try {
        write_json(store_, key_, array);
        return true;
    } catch (const storage_error& e) {
        LOG_ERROR("pending_ops", "Failed to save pending operations: %s", e.what());
        return false;
    }
}

size_t pending_operation_store::load() {
    std::optional<nlohmann::json> stored;
    try {
        stored = read_json(store_, key_);
    } catch (const storage_error& e) {
        LOG_ERROR("pending_ops", "Failed to load pending operations: %s", e.what());
        return 0;
    }
    if (!stored) return 0;
    if (!stored->is_array()) {
        LOG_WARN("pending_ops", "Ignoring stored pending operations: not an array");
        return 0;
    }

    operations_.clear();
    for (const auto& entry : *stored) {
        auto op = pending_operation::from_json(entry);
        if (!op) {
            LOG_WARN("pending_ops", "Failed to parse cached sync operation: %s", entry.dump().c_str());
            continue;
        }

        // Resume id generation after the highest stored sequence number
        auto sep = op->id.rfind('_');
        if (sep != std::string::npos && op->id.rfind("sync_", 0) == 0) {
            try {
                uint64_t seq = std::stoull(op->id.substr(sep + 1));
                next_sequence_ = std::max(next_sequence_, seq + 1);
            } catch (const std::exception&) {
                LOG_DEBUG("pending_ops", "Operation id %s carries no sequence", op->id.c_str());
            }
        }
        operations_.push_back(std::move(*op));
    }

    LOG_INFO("pending_ops", "Loaded %zu pending sync operations from cache", operations_.size());
    return operations_.size();
}

pending_operation_store::batch::batch(pending_operation_store& store) : store_(store) {
    ++store_.batch_depth_;
}

pending_operation_store::batch::~batch() {
    if (--store_.batch_depth_ == 0 && store_.dirty_) {
        store_.persist();
    }
}

} // namespace tideline
