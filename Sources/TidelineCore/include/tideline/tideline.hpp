#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include "types.hpp"
#include "scheduler.hpp"
#include "observation.hpp"
#include "db.hpp"
#include "kv_store.hpp"
#include "remote.hpp"
#include "realtime.hpp"
#include "connectivity.hpp"
#include "local_cache.hpp"
#include "pending_operations.hpp"
#include "conflict_resolver.hpp"
#include "subscription_manager.hpp"
#include "sync.hpp"
#include "message_queue.hpp"

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace tideline {

struct engine_config {
    /// SQLite file backing the pending queue, message queue and cache (":memory:" for none).
    std::string storage_path = ":memory:";
    sync_config sync;
    reconnect_policy reconnect;
    message_queue_config messages;
    connectivity_config connectivity;
    /// Applied to the global log threshold when the engine is built; unset leaves it alone.
    std::optional<log_level> log;

    /// {"storage_path", "log_level", "sync": {...}, "reconnect": {...}, "messages": {...}, "connectivity": {...}}
    static std::optional<engine_config> from_json(const std::string& json);
    std::string to_json() const;
};

// ============================================================================
// sync_engine - Owns and wires the sync core for one host process
// ============================================================================
//
// The host supplies the scheduler and the platform collaborators (remote API,
// push transport, connectivity source); everything else is built here.
// Reconnection also drains the offline message queue when a sender is set.

class sync_engine {
public:
    sync_engine(engine_config config,
                SharedScheduler scheduler,
                remote_data_api& remote,
                realtime_transport& transport,
                connectivity_source& source,
                reachability_probe probe = nullptr);
    ~sync_engine();

    sync_engine(const sync_engine&) = delete;
    sync_engine& operator=(const sync_engine&) = delete;

    void start();
    void stop();

    void set_message_sender(offline_message_queue::sender send) { message_sender_ = std::move(send); }

    sync_orchestrator& orchestrator() { return *orchestrator_; }
    subscription_manager& subscriptions() { return *subscriptions_; }
    offline_message_queue& messages() { return *messages_; }
    connectivity_monitor& connectivity() { return *connectivity_; }
    local_cache& cache() { return *cache_; }
    kv_store& storage() { return *storage_; }

    [[nodiscard]] nlohmann::json health_status() const;

private:
    engine_config config_;
    SharedScheduler scheduler_;
    std::unique_ptr<sqlite_kv_store> storage_;
    std::unique_ptr<kv_local_cache> cache_;
    std::unique_ptr<connectivity_monitor> connectivity_;
    std::unique_ptr<subscription_manager> subscriptions_;
    std::unique_ptr<sync_orchestrator> orchestrator_;
    std::unique_ptr<offline_message_queue> messages_;
    offline_message_queue::sender message_sender_;
    notification_token reconnect_token_;
    bool started_ = false;
};

} // namespace tideline

#endif // __cplusplus
