#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "observation.hpp"
#include "pending_operations.hpp"
#include "conflict_resolver.hpp"
#include "realtime.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tideline {

class remote_data_api;
class kv_store;
class local_cache;
class connectivity_monitor;
class subscription_manager;
struct connectivity_event;

// ============================================================================
// Sync Status / Config / Events
// ============================================================================

enum class sync_status : int {
    idle = 0,
    syncing = 1,
    success = 2,
    error = 3,
    offline = 4
};

const char* to_string(sync_status status) noexcept;

struct sync_config {
    std::chrono::milliseconds sync_interval = std::chrono::minutes(5);
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay = std::chrono::seconds(2);
    std::chrono::milliseconds max_retry_delay = std::chrono::minutes(5);
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds conflict_resolution_window = std::chrono::seconds(30);
    std::chrono::milliseconds sync_debounce = std::chrono::seconds(1);
    std::string pending_operations_key = pending_operation_store::default_key;

    /// Durations are in seconds. Unknown keys are ignored, missing keys keep defaults.
    static std::optional<sync_config> from_json(const std::string& json);
    std::string to_json() const;
};

/// Delay before the next whole-pass retry: initial * multiplier^average_retry_count,
/// clamped to [initial_retry_delay, max_retry_delay].
std::chrono::milliseconds compute_retry_delay(const sync_config& config, int average_retry_count);

enum class sync_event_type : int {
    operation_queued,
    sync_completed,
    realtime_change_processed,
    connectivity_changed,
    pending_operations_cleared,
    operation_dropped,
    auth_required,
    cache_update_failed
};

const char* to_string(sync_event_type type) noexcept;

struct sync_event {
    sync_event_type type = sync_event_type::sync_completed;
    timestamp_t at;

    std::string table;
    std::optional<std::string> record_id;
    std::optional<std::string> operation_id;
    std::optional<change_kind> change;

    int success_count = 0;          ///< sync_completed
    int error_count = 0;            ///< sync_completed
    size_t pending_count = 0;       ///< operations still queued after the event
    size_t conflicts_resolved = 0;  ///< realtime_change_processed
    bool is_online = false;         ///< connectivity_changed
    std::string reason;             ///< operation_dropped, auth_required, cache_update_failed
    std::chrono::milliseconds duration{0};

    nlohmann::json to_json() const;
};

// ============================================================================
// sync_orchestrator - Drains pending operations against the remote store
// ============================================================================
//
// Not thread-safe: every public method must be called on the scheduler's
// context. Remote completions and connectivity transitions are re-posted
// onto the scheduler, so passes, realtime changes and timers never overlap
// except at remote round trips.

class sync_orchestrator {
public:
    sync_orchestrator(SharedScheduler scheduler,
                      remote_data_api& remote,
                      kv_store& store,
                      local_cache& cache,
                      connectivity_monitor& connectivity,
                      sync_config config = {},
                      subscription_manager* subscriptions = nullptr);
    ~sync_orchestrator();

    sync_orchestrator(const sync_orchestrator&) = delete;
    sync_orchestrator& operator=(const sync_orchestrator&) = delete;

    /// Load persisted operations, read connectivity and start the periodic timer.
    void start();

    /// Cancel timers, drop observers and watched channels. A pass in flight is
    /// abandoned: its remote completions are ignored.
    void stop();

    [[nodiscard]] bool is_started() const noexcept { return started_; }

    /// Queue a mutation and, when online, schedule a debounced sync.
    /// Throws std::invalid_argument for update/remove without a record id.
    /// Returns nullopt (and queues nothing) when the orchestrator is stopped.
    std::optional<std::string> queue_operation(const std::string& table,
                                               operation_kind kind,
                                               record payload,
                                               std::optional<std::string> record_id = std::nullopt);

    /// Run one pass over a snapshot of the pending operations.
    /// No-op while a pass is in flight, or while offline unless forced.
    void sync(bool force = false);

    /// Apply a pushed change: resolve conflicts, update the cache, stamp the table.
    void handle_realtime_change(const std::string& table, change_kind kind, const record& row);

    /// Subscribe to pushes for table and route them into handle_realtime_change.
    /// Throws std::logic_error without a subscription manager.
    void watch_table(const std::string& subscription_id,
                     const std::string& table,
                     std::optional<channel_filter> filter = std::nullopt);

    [[nodiscard]] bool needs_sync(const std::string& table,
                                  std::optional<std::chrono::milliseconds> max_age = std::nullopt) const;
    [[nodiscard]] std::optional<timestamp_t> last_sync_time(const std::string& table) const;

    void clear_pending_operations();

    [[nodiscard]] size_t pending_operations_count() const noexcept { return store_.size(); }
    [[nodiscard]] std::vector<pending_operation> pending_operations() const { return store_.list(); }

    [[nodiscard]] sync_status status() const noexcept { return status_; }
    [[nodiscard]] bool is_online() const noexcept { return online_; }
    [[nodiscard]] bool is_syncing() const noexcept { return current_pass_ != nullptr; }

    [[nodiscard]] bool has_retry_timer() const { return retry_timer_ && retry_timer_->is_pending(); }
    [[nodiscard]] bool has_scheduled_sync() const { return debounce_timer_ && debounce_timer_->is_pending(); }
    [[nodiscard]] bool has_periodic_timer() const { return periodic_timer_ && periodic_timer_->is_pending(); }

    /// The current status is delivered immediately, then every change.
    [[nodiscard]] notification_token observe_status(std::function<void(sync_status)> fn);

    /// Future events only.
    [[nodiscard]] notification_token observe_events(std::function<void(const sync_event&)> fn);

    [[nodiscard]] nlohmann::json health_status() const;

    [[nodiscard]] const sync_config& config() const noexcept { return config_; }

private:
    struct sync_pass {
        std::vector<pending_operation> snapshot;
        size_t index = 0;
        int success_count = 0;
        int error_count = 0;
        bool auth_failed = false;
        bool cancelled = false;
        timestamp_t started_at;
        std::unique_ptr<pending_operation_store::batch> batch;
    };

    void process_next(const std::shared_ptr<sync_pass>& pass);
    void dispatch(const pending_operation& op, std::function<void(std::exception_ptr)> done);
    void on_operation_result(const std::shared_ptr<sync_pass>& pass,
                             const std::string& operation_id,
                             std::exception_ptr error);
    void finish_pass(const std::shared_ptr<sync_pass>& pass);
    void cancel_pass();

    void schedule_sync_attempt();
    void schedule_retry();
    void arm_periodic();
    void on_connectivity(const connectivity_event& event);

    void set_status(sync_status status);
    sync_event make_event(sync_event_type type) const;
    void emit(const sync_event& event);

    SharedScheduler scheduler_;
    remote_data_api& remote_;
    local_cache& cache_;
    connectivity_monitor& connectivity_;
    subscription_manager* subscriptions_;
    sync_config config_;

    pending_operation_store store_;
    conflict_resolver resolver_;
    std::map<std::string, timestamp_t> last_sync_times_;
    std::vector<std::string> watched_subscriptions_;

    sync_status status_ = sync_status::idle;
    bool online_ = true;
    bool started_ = false;
    std::shared_ptr<sync_pass> current_pass_;

    timer_handle periodic_timer_;
    timer_handle debounce_timer_;
    timer_handle retry_timer_;

    observable<sync_status> status_changed_;
    observable<sync_event> events_;
    notification_token connectivity_token_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace tideline

#endif // __cplusplus
