#include "tideline/connectivity.hpp"
#include "tideline/log.hpp"

namespace tideline {

std::optional<connectivity_config> connectivity_config::from_json(const std::string& json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("connectivity", "Invalid connectivity config JSON");
        return std::nullopt;
    }
    connectivity_config config;
    if (j.contains("verification_interval") && j["verification_interval"].is_number()) {
        config.verification_interval = std::chrono::milliseconds(
            static_cast<int64_t>(j["verification_interval"].get<double>() * 1000));
    }
    return config;
}

std::string connectivity_config::to_json() const {
    nlohmann::json j;
    j["verification_interval"] = static_cast<double>(verification_interval.count()) / 1000.0;
    return j.dump();
}

connectivity_monitor::connectivity_monitor(SharedScheduler scheduler,
                                           connectivity_source& source,
                                           connectivity_config config,
                                           reachability_probe probe)
    : scheduler_(std::move(scheduler))
    , source_(source)
    , config_(config)
    , probe_(std::move(probe))
    , online_(source.current_status())
    , alive_(std::make_shared<std::atomic<bool>>(true)) {}

connectivity_monitor::~connectivity_monitor() {
    *alive_ = false;
    stop();
}

void connectivity_monitor::start() {
    if (started_) return;
    started_ = true;

    online_ = source_.current_status();
    was_offline_ = !online_;
    LOG_INFO("connectivity", "Monitoring connectivity (initially %s)", online_ ? "online" : "offline");

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    source_token_ = source_.observe([this, weak_alive](bool online) {
        scheduler_->invoke([this, weak_alive, online] {
            auto alive = weak_alive.lock();
            if (!alive || !*alive) return;
            on_source_changed(online);
        });
    });

    if (online_) verify_now();
    arm_verification();
}

void connectivity_monitor::stop() {
    if (!started_) return;
    started_ = false;
    source_token_.unregister();
    verification_timer_.reset();
}

notification_token connectivity_monitor::observe(std::function<void(const connectivity_event&)> fn) {
    return events_.observe(std::move(fn));
}

void connectivity_monitor::on_source_changed(bool online) {
    if (!started_) return;
    if (!online) {
        report(false);
        return;
    }
    if (probe_) {
        verify_now();
    } else {
        report(true);
    }
}

void connectivity_monitor::verify_now() {
    if (!probe_) return;

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    probe_([this, weak_alive](bool reachable) {
        scheduler_->invoke([this, weak_alive, reachable] {
            auto alive = weak_alive.lock();
            if (!alive || !*alive || !started_) return;
            // A link the source reports down stays down regardless of the probe
            report(reachable && source_.current_status());
        });
    });
}

void connectivity_monitor::report(bool online) {
    if (online == online_) return;

    const bool reconnection = online && was_offline_;
    online_ = online;
    if (!online) was_offline_ = true;
    ++transitions_;
    last_change_ = scheduler_->now();

    LOG_INFO("connectivity", "Connectivity status changed: %s", online ? "Connected" : "Disconnected");
    events_.emit(connectivity_event{online, *last_change_, reconnection});
}

void connectivity_monitor::arm_verification() {
    if (!probe_ || config_.verification_interval.count() <= 0) return;

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    verification_timer_ = scheduler_->schedule_after(config_.verification_interval, [this, weak_alive] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive || !started_) return;
        if (source_.current_status()) {
            verify_now();
        }
        arm_verification();
    });
}

} // namespace tideline
