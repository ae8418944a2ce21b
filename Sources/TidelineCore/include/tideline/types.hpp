#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tideline {

// Wall-clock timestamp. Persisted values are truncated to milliseconds.
using timestamp_t = std::chrono::system_clock::time_point;

using ByteVector = std::vector<uint8_t>;

// Opaque row payload exchanged with the remote store and the local cache.
// Rows are JSON objects; the core only reads "id" and "updated_at".
using record = nlohmann::json;

// ============================================================================
// Operation / change kinds
// ============================================================================

enum class operation_kind : int {
    create = 0,
    update = 1,
    remove = 2
};

enum class change_kind : int {
    insert = 0,
    update = 1,
    remove = 2
};

const char* to_string(operation_kind kind) noexcept;
const char* to_string(change_kind kind) noexcept;

std::optional<operation_kind> parse_operation_kind(std::string_view name);
std::optional<change_kind> parse_change_kind(std::string_view name);

/// True for kinds that address an existing row and therefore need a record id.
constexpr bool requires_record_id(operation_kind kind) noexcept {
    return kind != operation_kind::create;
}

// ============================================================================
// Timestamp helpers
// ============================================================================

inline timestamp_t truncate_to_millis(timestamp_t t) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(t);
}

/// Format as ISO-8601 UTC with millisecond precision ("2024-01-01T00:00:00.000Z").
std::string format_timestamp(timestamp_t t);

/// Parse ISO-8601 ("YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]").
/// A missing zone designator is read as UTC.
std::optional<timestamp_t> parse_timestamp(std::string_view text);

/// The "id" field of a row as a string (numeric ids are stringified).
std::optional<std::string> record_id_of(const record& row);

/// The "updated_at" field of a row. Accepts ISO-8601 strings or epoch milliseconds.
std::optional<timestamp_t> record_modified_at(const record& row);

} // namespace tideline

#endif // __cplusplus
