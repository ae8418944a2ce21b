#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <optional>
#include <string_view>

namespace tideline {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold, defined in TidelineCore/src/tideline.cpp.
/// Tags in use: "sync", "realtime", "message_queue", "pending_ops",
/// "connectivity", "cache", "kv", "db", "remote".
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

/// Accepts the names to_string produces; used for the "log_level" config key.
inline std::optional<log_level> parse_log_level(std::string_view name) {
    for (auto level : {log_level::off, log_level::error, log_level::warn, log_level::info, log_level::debug}) {
        if (name == to_string(level)) return level;
    }
    return std::nullopt;
}

}  // namespace tideline

// Lines look like "[tideline:sync] warn: ..."
#define TIDELINE_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(tideline::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[tideline:%s] %s: " fmt "\n", tag, tideline::to_string(level), ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) TIDELINE_LOG(tideline::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  TIDELINE_LOG(tideline::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  TIDELINE_LOG(tideline::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) TIDELINE_LOG(tideline::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
