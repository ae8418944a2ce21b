#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "observation.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tideline {

// ============================================================================
// Connectivity signal source (supplied by the host platform)
// ============================================================================

class connectivity_source {
public:
    using listener = std::function<void(bool online)>;

    virtual ~connectivity_source() = default;

    virtual bool current_status() const = 0;

    /// Register for online/offline transitions. May be called back on any thread.
    [[nodiscard]] virtual notification_token observe(listener fn) = 0;
};

class manual_connectivity_source : public connectivity_source {
public:
    explicit manual_connectivity_source(bool online = true) : online_(online) {}

    bool current_status() const override { return online_; }

    [[nodiscard]] notification_token observe(listener fn) override {
        return transitions_.observe([fn = std::move(fn)](const bool& online) { fn(online); });
    }

    void set_online(bool online) {
        online_ = online;
        transitions_.emit(online);
    }

private:
    std::atomic<bool> online_;
    observable<bool> transitions_;
};

// ============================================================================
// Connectivity monitor
// ============================================================================

struct connectivity_config {
    /// How often the reachability probe re-checks a link the source reports as up.
    /// Zero disables periodic verification.
    std::chrono::milliseconds verification_interval = std::chrono::seconds(30);

    static std::optional<connectivity_config> from_json(const std::string& json);
    std::string to_json() const;
};

struct connectivity_event {
    bool is_online = false;
    timestamp_t at;
    bool is_reconnection = false;  ///< online again after an earlier offline report
};

/// Asynchronous "can we actually reach the backend" check; calls done(reachable).
using reachability_probe = std::function<void(std::function<void(bool reachable)> done)>;

class connectivity_monitor {
public:
    connectivity_monitor(SharedScheduler scheduler,
                         connectivity_source& source,
                         connectivity_config config = {},
                         reachability_probe probe = nullptr);
    ~connectivity_monitor();

    connectivity_monitor(const connectivity_monitor&) = delete;
    connectivity_monitor& operator=(const connectivity_monitor&) = delete;

    /// Read the initial status, listen to the source and arm periodic verification.
    void start();
    void stop();

    [[nodiscard]] bool is_online() const noexcept { return online_; }

    /// Receive future transitions (duplicates are suppressed).
    [[nodiscard]] notification_token observe(std::function<void(const connectivity_event&)> fn);

    /// Run the reachability probe now (no-op without a probe).
    void verify_now();

    [[nodiscard]] size_t transition_count() const noexcept { return transitions_; }
    [[nodiscard]] std::optional<timestamp_t> last_change() const { return last_change_; }
    [[nodiscard]] const connectivity_config& config() const noexcept { return config_; }

private:
    void on_source_changed(bool online);
    void report(bool online);
    void arm_verification();

    SharedScheduler scheduler_;
    connectivity_source& source_;
    connectivity_config config_;
    reachability_probe probe_;

    std::atomic<bool> online_;
    bool was_offline_ = false;
    bool started_ = false;
    size_t transitions_ = 0;
    std::optional<timestamp_t> last_change_;

    observable<connectivity_event> events_;
    notification_token source_token_;
    timer_handle verification_timer_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace tideline

#endif // __cplusplus
