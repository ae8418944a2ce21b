#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "observation.hpp"
#include "realtime.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tideline {

enum class subscription_state : int {
    disconnected = 0,
    connecting = 1,
    connected = 2,
    error = 3
};

const char* to_string(subscription_state state) noexcept;

/// Bounded exponential backoff for channel reconnection.
struct reconnect_policy {
    std::chrono::milliseconds base_delay = std::chrono::seconds(2);
    double multiplier = 1.5;
    std::chrono::milliseconds max_delay = std::chrono::seconds(30);
    int max_attempts = 5;

    /// Delay before the given 1-based attempt: base * multiplier^(attempt-1), within [base, max].
    [[nodiscard]] std::chrono::milliseconds delay_for_attempt(int attempt) const;

    static std::optional<reconnect_policy> from_json(const std::string& json);
    std::string to_json() const;
};

struct subscription_config {
    std::string table;
    std::optional<channel_filter> filter;
    realtime_channel::change_handler on_insert;
    realtime_channel::change_handler on_update;
    realtime_channel::change_handler on_delete;
};

using subscription_states = std::map<std::string, subscription_state>;

// ============================================================================
// subscription_manager - One push channel per subscription id
// ============================================================================
//
//   disconnected -> connecting -> connected
//   connecting | connected -> error -> connecting   (timed out, channel error, closed)
//
// Failed channels are reopened after reconnect_policy delays. Each channel
// has at most one reconnect timer; subscribe/unsubscribe cancel it. After
// max_attempts consecutive failures the channel stays in error and observers
// of channel_abandoned are told.
//
// Not thread-safe: call from the scheduler's context. Transport callbacks
// are re-posted onto the scheduler.

class subscription_manager {
public:
    subscription_manager(SharedScheduler scheduler,
                         realtime_transport& transport,
                         reconnect_policy policy = {});
    ~subscription_manager();

    subscription_manager(const subscription_manager&) = delete;
    subscription_manager& operator=(const subscription_manager&) = delete;

    /// Create or replace the channel for id. Throws std::invalid_argument for
    /// an empty id or table.
    void subscribe(const std::string& id, subscription_config config);

    void unsubscribe(const std::string& id);
    void unsubscribe_all();

    /// Tear down and reopen every configured channel with a fresh attempt budget.
    void reconnect_all();

    [[nodiscard]] bool is_connected(const std::string& id) const;
    [[nodiscard]] subscription_state state(const std::string& id) const;
    [[nodiscard]] subscription_states states() const;
    [[nodiscard]] bool contains(const std::string& id) const { return channels_.count(id) > 0; }

    /// Consecutive failed attempts since the channel was last connected.
    [[nodiscard]] int failed_attempts(const std::string& id) const;
    [[nodiscard]] bool has_pending_reconnect(const std::string& id) const;
    [[nodiscard]] bool is_abandoned(const std::string& id) const;

    /// Receives the current snapshot immediately, then one per transition.
    [[nodiscard]] notification_token observe_states(std::function<void(const subscription_states&)> fn);

    /// Receives the id of every channel that exhausts its reconnect attempts.
    [[nodiscard]] notification_token observe_abandoned(std::function<void(const std::string&)> fn);

    [[nodiscard]] nlohmann::json health_status() const;

    [[nodiscard]] const reconnect_policy& policy() const noexcept { return policy_; }

    static std::string channel_name(const std::string& table, const std::string& id) {
        return "realtime_" + table + "_" + id;
    }

private:
    struct channel_entry {
        subscription_config config;
        SharedRealtimeChannel channel;
        subscription_state state = subscription_state::disconnected;
        int failed_attempts = 0;
        uint64_t generation = 0;
        timer_handle reconnect_timer;
        bool abandoned = false;
    };

    // Returns true if the channel was abandoned while opening
    bool open(const std::string& id, channel_entry& entry);
    void close(channel_entry& entry);
    void on_status(const std::string& id, uint64_t generation, channel_status status, const std::string& error);
    void on_change(const std::string& id, uint64_t generation, change_kind kind, const record& row);
    // Arms the next reconnect; returns true once the attempt budget is spent
    bool handle_failure(const std::string& id, channel_entry& entry);
    void set_state(channel_entry& entry, subscription_state state);
    void notify_states();

    SharedScheduler scheduler_;
    realtime_transport& transport_;
    reconnect_policy policy_;

    std::map<std::string, channel_entry> channels_;
    uint64_t next_generation_ = 0;

    observable<subscription_states> states_changed_;
    observable<std::string> channel_abandoned_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace tideline

#endif // __cplusplus
