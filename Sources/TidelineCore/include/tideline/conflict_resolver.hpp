#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "pending_operations.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace tideline {

// ============================================================================
// conflict_resolver - Last-write-wins between queued local writes and pushes
// ============================================================================
//
// Only operations on the same (table, record id) queued less than `window`
// before now are candidates. A candidate loses (is discarded) when the remote
// row was modified strictly after it was queued; otherwise it is retained and
// goes out with the next sync pass.

struct conflict_verdict {
    std::vector<std::string> discard;  ///< operation ids the remote change supersedes
    std::vector<std::string> retain;   ///< candidates that are newer than the remote change

    [[nodiscard]] size_t size() const noexcept { return discard.size() + retain.size(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
};

class conflict_resolver {
public:
    explicit conflict_resolver(std::chrono::milliseconds window) : window_(window) {}

    [[nodiscard]] std::vector<pending_operation> find_candidates(const std::vector<pending_operation>& operations,
                                                                 const std::string& table,
                                                                 const std::string& record_id,
                                                                 timestamp_t now) const;

    [[nodiscard]] conflict_verdict resolve(const std::vector<pending_operation>& candidates,
                                           timestamp_t remote_modified_at) const;

    /// find_candidates + resolve for a pushed row. The row's "updated_at"
    /// falls back to now; a row without an id conflicts with nothing.
    [[nodiscard]] conflict_verdict evaluate(const std::vector<pending_operation>& operations,
                                            const std::string& table,
                                            const record& remote_row,
                                            timestamp_t now) const;

    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

private:
    std::chrono::milliseconds window_;
};

} // namespace tideline

#endif // __cplusplus
