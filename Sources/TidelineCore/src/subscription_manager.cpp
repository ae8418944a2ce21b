#include "tideline/subscription_manager.hpp"
#include "tideline/log.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tideline {

const char* to_string(subscription_state state) noexcept {
    switch (state) {
        case subscription_state::disconnected: return "disconnected";
        case subscription_state::connecting: return "connecting";
        case subscription_state::connected: return "connected";
        case subscription_state::error: return "error";
    }
    return "unknown";
}

// ============================================================================
// reconnect_policy
// ============================================================================

std::chrono::milliseconds reconnect_policy::delay_for_attempt(int attempt) const {
    const double base = static_cast<double>(base_delay.count());
    const double raw = base * std::pow(multiplier, std::max(0, attempt - 1));
    const double bounded = std::min(std::max(raw, base), static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(bounded)));
}

std::optional<reconnect_policy> reconnect_policy::from_json(const std::string& json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("realtime", "Invalid reconnect policy JSON");
        return std::nullopt;
    }

    auto seconds = [&](const char* key, std::chrono::milliseconds& out) {
        if (j.contains(key) && j[key].is_number()) {
            out = std::chrono::milliseconds(static_cast<int64_t>(j[key].get<double>() * 1000));
        }
    };

    reconnect_policy policy;
    seconds("base_delay", policy.base_delay);
    seconds("max_delay", policy.max_delay);
    if (j.contains("multiplier") && j["multiplier"].is_number()) {
        policy.multiplier = j["multiplier"].get<double>();
    }
    if (j.contains("max_attempts") && j["max_attempts"].is_number_integer()) {
        policy.max_attempts = j["max_attempts"].get<int>();
    }
    return policy;
}

std::string reconnect_policy::to_json() const {
    nlohmann::json j;
    j["base_delay"] = static_cast<double>(base_delay.count()) / 1000.0;
    j["multiplier"] = multiplier;
    j["max_delay"] = static_cast<double>(max_delay.count()) / 1000.0;
    j["max_attempts"] = max_attempts;
    return j.dump();
}

// ============================================================================
// subscription_manager
// ============================================================================

subscription_manager::subscription_manager(SharedScheduler scheduler,
                                           realtime_transport& transport,
                                           reconnect_policy policy)
    : scheduler_(std::move(scheduler))
    , transport_(transport)
    , policy_(policy)
    , alive_(std::make_shared<std::atomic<bool>>(true)) {}

subscription_manager::~subscription_manager() {
    *alive_ = false;
    for (auto& [id, entry] : channels_) {
        entry.reconnect_timer.reset();
        close(entry);
    }
}

void subscription_manager::subscribe(const std::string& id, subscription_config config) {
    if (id.empty() || config.table.empty()) {
        throw std::invalid_argument("Subscription requires an id and a table");
    }

    auto& entry = channels_[id];
    entry.reconnect_timer.reset();
    close(entry);

    entry.config = std::move(config);
    entry.failed_attempts = 0;
    entry.abandoned = false;
    entry.state = subscription_state::disconnected;

    const bool abandoned = open(id, entry);
    notify_states();
    if (abandoned) channel_abandoned_.emit(id);
}

void subscription_manager::unsubscribe(const std::string& id) {
    auto it = channels_.find(id);
    if (it == channels_.end()) return;

    LOG_INFO("realtime", "Unsubscribing from: %s", id.c_str());
    it->second.reconnect_timer.reset();
    close(it->second);
    channels_.erase(it);
    notify_states();
}

void subscription_manager::unsubscribe_all() {
    if (channels_.empty()) return;

    LOG_INFO("realtime", "Unsubscribing from all %zu subscriptions", channels_.size());
    for (auto& [id, entry] : channels_) {
        entry.reconnect_timer.reset();
        close(entry);
    }
    channels_.clear();
    notify_states();
}

void subscription_manager::reconnect_all() {
    if (channels_.empty()) return;

    LOG_INFO("realtime", "Reconnecting all subscriptions");
    std::vector<std::string> abandoned;
    for (auto& [id, entry] : channels_) {
        entry.reconnect_timer.reset();
        close(entry);
        entry.failed_attempts = 0;
        entry.abandoned = false;
        if (open(id, entry)) abandoned.push_back(id);
    }
    notify_states();
    for (const auto& id : abandoned) {
        channel_abandoned_.emit(id);
    }
}

bool subscription_manager::is_connected(const std::string& id) const {
    return state(id) == subscription_state::connected;
}

subscription_state subscription_manager::state(const std::string& id) const {
    auto it = channels_.find(id);
    return it == channels_.end() ? subscription_state::disconnected : it->second.state;
}

subscription_states subscription_manager::states() const {
    subscription_states snapshot;
    for (const auto& [id, entry] : channels_) {
        snapshot.emplace(id, entry.state);
    }
    return snapshot;
}

int subscription_manager::failed_attempts(const std::string& id) const {
    auto it = channels_.find(id);
    return it == channels_.end() ? 0 : it->second.failed_attempts;
}

bool subscription_manager::has_pending_reconnect(const std::string& id) const {
    auto it = channels_.find(id);
    return it != channels_.end() && it->second.reconnect_timer && it->second.reconnect_timer->is_pending();
}

bool subscription_manager::is_abandoned(const std::string& id) const {
    auto it = channels_.find(id);
    return it != channels_.end() && it->second.abandoned;
}

notification_token subscription_manager::observe_states(std::function<void(const subscription_states&)> fn) {
    fn(states());
    return states_changed_.observe(std::move(fn));
}

notification_token subscription_manager::observe_abandoned(std::function<void(const std::string&)> fn) {
    return channel_abandoned_.observe(std::move(fn));
}

nlohmann::json subscription_manager::health_status() const {
    size_t connected = 0;
    size_t pending_reconnects = 0;
    nlohmann::json statuses = nlohmann::json::object();
    nlohmann::json abandoned = nlohmann::json::array();
    for (const auto& [id, entry] : channels_) {
        if (entry.state == subscription_state::connected) ++connected;
        if (entry.reconnect_timer && entry.reconnect_timer->is_pending()) ++pending_reconnects;
        if (entry.abandoned) abandoned.push_back(id);
        statuses[id] = to_string(entry.state);
    }

    nlohmann::json j;
    j["total_subscriptions"] = channels_.size();
    j["connected_subscriptions"] = connected;
    j["pending_reconnects"] = pending_reconnects;
    j["abandoned_subscriptions"] = abandoned;
    j["subscription_statuses"] = statuses;
    j["timestamp"] = format_timestamp(scheduler_->now());
    return j;
}

bool subscription_manager::open(const std::string& id, channel_entry& entry) {
    entry.generation = ++next_generation_;
    const uint64_t generation = entry.generation;
    set_state(entry, subscription_state::connecting);

    const auto name = channel_name(entry.config.table, id);
    LOG_INFO("realtime", "Creating subscription %s for table: %s", name.c_str(), entry.config.table.c_str());

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    auto forward = [this, weak_alive, id, generation](change_kind kind) {
        return [this, weak_alive, id, generation, kind](const record& row) {
            scheduler_->invoke([this, weak_alive, id, generation, kind, row] {
                auto alive = weak_alive.lock();
                if (!alive || !*alive) return;
                on_change(id, generation, kind, row);
            });
        };
    };

    try {
        entry.channel = transport_.open_channel(name, entry.config.table, entry.config.filter);
        if (!entry.channel) {
            throw std::runtime_error("transport returned no channel");
        }
        if (entry.config.on_insert) entry.channel->on_insert(forward(change_kind::insert));
        if (entry.config.on_update) entry.channel->on_update(forward(change_kind::update));
        if (entry.config.on_delete) entry.channel->on_delete(forward(change_kind::remove));

        entry.channel->subscribe([this, weak_alive, id, generation](channel_status status, const std::string& error) {
            scheduler_->invoke([this, weak_alive, id, generation, status, error] {
                auto alive = weak_alive.lock();
                if (!alive || !*alive) return;
                on_status(id, generation, status, error);
            });
        });
    } catch (const std::exception& e) {
        LOG_ERROR("realtime", "Failed to subscribe to %s: %s", entry.config.table.c_str(), e.what());
        close(entry);
        set_state(entry, subscription_state::error);
        return handle_failure(id, entry);
    }
    return false;
}

void subscription_manager::close(channel_entry& entry) {
    if (!entry.channel) return;
    auto channel = std::move(entry.channel);
    entry.channel.reset();
    try {
        channel->close();
    } catch (const std::exception& e) {
        LOG_WARN("realtime", "Failed to close channel %s: %s", channel->name().c_str(), e.what());
    }
}

void subscription_manager::on_status(const std::string& id, uint64_t generation,
                                     channel_status status, const std::string& error) {
    auto it = channels_.find(id);
    if (it == channels_.end() || it->second.generation != generation) {
        LOG_DEBUG("realtime", "Ignoring %s for superseded channel %s", to_string(status), id.c_str());
        return;
    }
    auto& entry = it->second;
    LOG_INFO("realtime", "Subscription status for %s: %s", entry.config.table.c_str(), to_string(status));

    bool abandoned = false;
    switch (status) {
        case channel_status::subscribed:
            entry.failed_attempts = 0;
            entry.abandoned = false;
            entry.reconnect_timer.reset();
            set_state(entry, subscription_state::connected);
            break;
        case channel_status::timed_out:
        case channel_status::channel_error:
        case channel_status::closed:
            // One failure per channel generation
            if (entry.state == subscription_state::error) return;
            if (!error.empty()) {
                LOG_ERROR("realtime", "Subscription error for %s: %s", entry.config.table.c_str(), error.c_str());
            }
            set_state(entry, subscription_state::error);
            abandoned = handle_failure(id, entry);
            break;
    }

    notify_states();
    if (abandoned) channel_abandoned_.emit(id);
}

void subscription_manager::on_change(const std::string& id, uint64_t generation, change_kind kind, const record& row) {
    auto it = channels_.find(id);
    if (it == channels_.end() || it->second.generation != generation) return;

    const auto& config = it->second.config;
    LOG_DEBUG("realtime", "Received %s for %s", to_string(kind), config.table.c_str());

    realtime_channel::change_handler handler;
    switch (kind) {
        case change_kind::insert: handler = config.on_insert; break;
        case change_kind::update: handler = config.on_update; break;
        case change_kind::remove: handler = config.on_delete; break;
    }
    if (handler) handler(row);
}

bool subscription_manager::handle_failure(const std::string& id, channel_entry& entry) {
    entry.reconnect_timer.reset();

    if (entry.failed_attempts >= policy_.max_attempts) {
        if (entry.abandoned) return false;
        entry.abandoned = true;
        LOG_WARN("realtime", "Max reconnection attempts reached for %s", id.c_str());
        return true;
    }

    ++entry.failed_attempts;
    const auto delay = policy_.delay_for_attempt(entry.failed_attempts);
    LOG_INFO("realtime", "Attempting reconnection for %s (attempt %d) in %lld ms",
             id.c_str(), entry.failed_attempts, static_cast<long long>(delay.count()));

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    const uint64_t generation = entry.generation;
    entry.reconnect_timer = scheduler_->schedule_after(delay, [this, weak_alive, id, generation] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive) return;

        auto it = channels_.find(id);
        if (it == channels_.end() || it->second.generation != generation) return;

        close(it->second);
        const bool abandoned = open(id, it->second);
        notify_states();
        if (abandoned) channel_abandoned_.emit(id);
    });
    return false;
}

void subscription_manager::set_state(channel_entry& entry, subscription_state state) {
    entry.state = state;
}

void subscription_manager::notify_states() {
    states_changed_.emit(states());
}

} // namespace tideline
