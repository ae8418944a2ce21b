#include "tideline/conflict_resolver.hpp"
#include "tideline/log.hpp"

namespace tideline {

std::vector<pending_operation> conflict_resolver::find_candidates(const std::vector<pending_operation>& operations,
                                                                  const std::string& table,
                                                                  const std::string& record_id,
                                                                  timestamp_t now) const {
    std::vector<pending_operation> candidates;
    for (const auto& op : operations) {
        if (op.table != table || op.record_id != record_id) continue;
        if (now - op.queued_at < window_) {
            candidates.push_back(op);
        }
    }
    return candidates;
}

conflict_verdict conflict_resolver::resolve(const std::vector<pending_operation>& candidates,
                                            timestamp_t remote_modified_at) const {
    conflict_verdict verdict;
    for (const auto& op : candidates) {
        if (remote_modified_at > op.queued_at) {
            LOG_DEBUG("sync", "Incoming data is newer, removing conflicting operation: %s", op.id.c_str());
            verdict.discard.push_back(op.id);
        } else {
            LOG_DEBUG("sync", "Local operation is newer, keeping: %s", op.id.c_str());
            verdict.retain.push_back(op.id);
        }
    }
    return verdict;
}

conflict_verdict conflict_resolver::evaluate(const std::vector<pending_operation>& operations,
                                             const std::string& table,
                                             const record& remote_row,
                                             timestamp_t now) const {
    auto record_id = record_id_of(remote_row);
    if (!record_id) return {};

    auto candidates = find_candidates(operations, table, *record_id, now);
    if (candidates.empty()) return {};

    auto modified_at = record_modified_at(remote_row).value_or(now);
    return resolve(candidates, modified_at);
}

} // namespace tideline
