#include "tideline/sync.hpp"
#include "tideline/connectivity.hpp"
#include "tideline/kv_store.hpp"
#include "tideline/local_cache.hpp"
#include "tideline/log.hpp"
#include "tideline/remote.hpp"
#include "tideline/subscription_manager.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tideline {

const char* to_string(sync_status status) noexcept {
    switch (status) {
        case sync_status::idle: return "idle";
        case sync_status::syncing: return "syncing";
        case sync_status::success: return "success";
        case sync_status::error: return "error";
        case sync_status::offline: return "offline";
    }
    return "unknown";
}

const char* to_string(sync_event_type type) noexcept {
    switch (type) {
        case sync_event_type::operation_queued: return "operation_queued";
        case sync_event_type::sync_completed: return "sync_completed";
        case sync_event_type::realtime_change_processed: return "realtime_change_processed";
        case sync_event_type::connectivity_changed: return "connectivity_changed";
        case sync_event_type::pending_operations_cleared: return "pending_operations_cleared";
        case sync_event_type::operation_dropped: return "operation_dropped";
        case sync_event_type::auth_required: return "auth_required";
        case sync_event_type::cache_update_failed: return "cache_update_failed";
    }
    return "unknown";
}

// ============================================================================
// sync_config
// ============================================================================

namespace {

double to_seconds(std::chrono::milliseconds d) {
    return static_cast<double>(d.count()) / 1000.0;
}

} // namespace

std::optional<sync_config> sync_config::from_json(const std::string& json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("sync", "Invalid sync config JSON");
        return std::nullopt;
    }

    auto seconds = [&](const char* key, std::chrono::milliseconds& out) {
        if (j.contains(key) && j[key].is_number()) {
            out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(j[key].get<double>() * 1000.0)));
        }
    };

    sync_config config;
    seconds("sync_interval", config.sync_interval);
    seconds("initial_retry_delay", config.initial_retry_delay);
    seconds("max_retry_delay", config.max_retry_delay);
    seconds("conflict_resolution_window", config.conflict_resolution_window);
    seconds("sync_debounce", config.sync_debounce);
    if (j.contains("max_retries") && j["max_retries"].is_number_integer()) {
        config.max_retries = j["max_retries"].get<int>();
    }
    if (j.contains("backoff_multiplier") && j["backoff_multiplier"].is_number()) {
        config.backoff_multiplier = j["backoff_multiplier"].get<double>();
    }
    if (j.contains("pending_operations_key") && j["pending_operations_key"].is_string()) {
        config.pending_operations_key = j["pending_operations_key"].get<std::string>();
    }
    return config;
}

std::string sync_config::to_json() const {
    nlohmann::json j;
    j["sync_interval"] = to_seconds(sync_interval);
    j["max_retries"] = max_retries;
    j["initial_retry_delay"] = to_seconds(initial_retry_delay);
    j["max_retry_delay"] = to_seconds(max_retry_delay);
    j["backoff_multiplier"] = backoff_multiplier;
    j["conflict_resolution_window"] = to_seconds(conflict_resolution_window);
    j["sync_debounce"] = to_seconds(sync_debounce);
    j["pending_operations_key"] = pending_operations_key;
    return j.dump();
}

std::chrono::milliseconds compute_retry_delay(const sync_config& config, int average_retry_count) {
    const double initial = static_cast<double>(config.initial_retry_delay.count());
    const double ceiling = std::max(initial, static_cast<double>(config.max_retry_delay.count()));
    const double raw = initial * std::pow(config.backoff_multiplier, std::max(0, average_retry_count));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(std::clamp(raw, initial, ceiling))));
}

nlohmann::json sync_event::to_json() const {
    nlohmann::json j;
    j["type"] = to_string(type);
    j["timestamp"] = format_timestamp(at);
    switch (type) {
        case sync_event_type::operation_queued:
            j["table"] = table;
            j["operation_id"] = operation_id.value_or("");
            j["pending_count"] = pending_count;
            break;
        case sync_event_type::sync_completed:
            j["success_count"] = success_count;
            j["error_count"] = error_count;
            j["duration_ms"] = duration.count();
            j["remaining_operations"] = pending_count;
            break;
        case sync_event_type::realtime_change_processed:
            j["table"] = table;
            j["change_type"] = change ? to_string(*change) : "";
            j["record_id"] = record_id ? nlohmann::json(*record_id) : nlohmann::json(nullptr);
            j["conflicts_resolved"] = conflicts_resolved;
            break;
        case sync_event_type::connectivity_changed:
            j["is_online"] = is_online;
            break;
        case sync_event_type::pending_operations_cleared:
            break;
        case sync_event_type::operation_dropped:
        case sync_event_type::auth_required:
        case sync_event_type::cache_update_failed:
            j["table"] = table;
            j["record_id"] = record_id ? nlohmann::json(*record_id) : nlohmann::json(nullptr);
            j["operation_id"] = operation_id ? nlohmann::json(*operation_id) : nlohmann::json(nullptr);
            j["reason"] = reason;
            break;
    }
    return j;
}

// ============================================================================
// sync_orchestrator
// ============================================================================

sync_orchestrator::sync_orchestrator(SharedScheduler scheduler,
                                     remote_data_api& remote,
                                     kv_store& store,
                                     local_cache& cache,
                                     connectivity_monitor& connectivity,
                                     sync_config config,
                                     subscription_manager* subscriptions)
    : scheduler_(std::move(scheduler))
    , remote_(remote)
    , cache_(cache)
    , connectivity_(connectivity)
    , subscriptions_(subscriptions)
    , config_(std::move(config))
    , store_(store, config_.pending_operations_key)
    , resolver_(config_.conflict_resolution_window)
    , alive_(std::make_shared<std::atomic<bool>>(true)) {}

sync_orchestrator::~sync_orchestrator() {
    *alive_ = false;
    stop();
}

void sync_orchestrator::start() {
    if (started_) return;
    started_ = true;

    LOG_INFO("sync", "Initializing sync orchestrator");
    store_.load();

    online_ = connectivity_.is_online();
    connectivity_token_ = connectivity_.observe([this](const connectivity_event& event) {
        on_connectivity(event);
    });

    arm_periodic();
    set_status(online_ ? sync_status::idle : sync_status::offline);

    // Resume draining whatever survived the last run
    if (online_ && !store_.empty()) {
        schedule_sync_attempt();
    }
    LOG_INFO("sync", "Sync orchestrator started (%s, %zu pending)",
             online_ ? "online" : "offline", store_.size());
}

void sync_orchestrator::stop() {
    if (!started_) return;
    started_ = false;

    LOG_INFO("sync", "Stopping sync orchestrator");
    periodic_timer_.reset();
    debounce_timer_.reset();
    retry_timer_.reset();
    connectivity_token_.unregister();

    if (subscriptions_) {
        for (const auto& id : watched_subscriptions_) {
            subscriptions_->unsubscribe(id);
        }
    }
    watched_subscriptions_.clear();

    if (current_pass_) {
        cancel_pass();
        set_status(online_ ? sync_status::idle : sync_status::offline);
    }
}

std::optional<std::string> sync_orchestrator::queue_operation(const std::string& table,
                                                              operation_kind kind,
                                                              record payload,
                                                              std::optional<std::string> record_id) {
    if (!started_) {
        LOG_WARN("sync", "Sync orchestrator is stopped, cannot queue operation");
        return std::nullopt;
    }

    auto id = store_.enqueue(table, kind, std::move(payload), record_id, scheduler_->now());

    auto event = make_event(sync_event_type::operation_queued);
    event.table = table;
    event.record_id = record_id;
    event.operation_id = id;
    emit(event);

    if (online_) {
        schedule_sync_attempt();
    }
    return id;
}

void sync_orchestrator::sync(bool force) {
    if (!started_) return;
    if (!online_ && !force) {
        LOG_DEBUG("sync", "Offline, skipping sync");
        return;
    }
    if (current_pass_) {
        LOG_DEBUG("sync", "Sync already in progress, skipping");
        return;
    }

    auto pass = std::make_shared<sync_pass>();
    pass->snapshot = store_.list();
    pass->started_at = scheduler_->now();
    pass->batch = std::make_unique<pending_operation_store::batch>(store_);
    current_pass_ = pass;

    set_status(sync_status::syncing);
    LOG_INFO("sync", "Starting sync process (%zu operations)", pass->snapshot.size());
    process_next(pass);
}

void sync_orchestrator::process_next(const std::shared_ptr<sync_pass>& pass) {
    while (pass->index < pass->snapshot.size()) {
        const auto& op = pass->snapshot[pass->index];

        // Dropped by a conflict or a clear while the pass was running
        if (!store_.find(op.id)) {
            ++pass->index;
            continue;
        }

        std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
        const std::string operation_id = op.id;
        dispatch(op, [this, weak_alive, pass, operation_id](std::exception_ptr error) {
            scheduler_->invoke([this, weak_alive, pass, operation_id, error] {
                auto alive = weak_alive.lock();
                if (!alive || !*alive) return;
                on_operation_result(pass, operation_id, error);
            });
        });
        return;
    }
    finish_pass(pass);
}

void sync_orchestrator::dispatch(const pending_operation& op, std::function<void(std::exception_ptr)> done) {
    try {
        switch (op.kind) {
            case operation_kind::create:
                remote_.create(op.table, op.payload, done);
                break;
            case operation_kind::update:
                remote_.update(op.table, op.record_id.value_or(""), op.payload, done);
                break;
            case operation_kind::remove:
                remote_.remove(op.table, op.record_id.value_or(""), done);
                break;
        }
    } catch (const std::exception& e) {
        LOG_WARN("sync", "Remote call for %s threw: %s", op.id.c_str(), e.what());
        done(std::current_exception());
    }
}

void sync_orchestrator::on_operation_result(const std::shared_ptr<sync_pass>& pass,
                                            const std::string& operation_id,
                                            std::exception_ptr error) {
    if (pass->cancelled || pass != current_pass_) {
        LOG_DEBUG("sync", "Ignoring completion for %s from an abandoned pass", operation_id.c_str());
        return;
    }
    if (pass->index >= pass->snapshot.size() || pass->snapshot[pass->index].id != operation_id) {
        LOG_WARN("sync", "Ignoring unexpected completion for %s", operation_id.c_str());
        return;
    }

    const auto op = pass->snapshot[pass->index];
    ++pass->index;

    if (!error) {
        store_.remove(operation_id);
        ++pass->success_count;
        LOG_DEBUG("sync", "Successfully synced operation: %s", operation_id.c_str());
        process_next(pass);
        return;
    }

    ++pass->error_count;
    const auto failure = classify_error(error);
    LOG_WARN("sync", "Failed to sync operation %s (%s): %s",
             operation_id.c_str(), to_string(failure.kind), failure.message.c_str());

    auto event = make_event(sync_event_type::operation_dropped);
    event.table = op.table;
    event.record_id = op.record_id;
    event.operation_id = operation_id;
    event.reason = failure.message;

    switch (failure.kind) {
        case remote_error_kind::conflict:
        case remote_error_kind::validation:
            store_.remove(operation_id);
            LOG_ERROR("sync", "Dropping operation %s: %s error is not retryable",
                      operation_id.c_str(), to_string(failure.kind));
            event.reason = std::string(to_string(failure.kind)) + ": " + failure.message;
            event.pending_count = store_.size();
            emit(event);
            break;

        case remote_error_kind::auth:
            // Kept as-is until the caller re-authenticates
            pass->auth_failed = true;
            event.type = sync_event_type::auth_required;
            event.pending_count = store_.size();
            emit(event);
            break;

        case remote_error_kind::transient_network:
        case remote_error_kind::server:
        case remote_error_kind::unknown: {
            auto retries = store_.increment_retry(operation_id);
            if (retries && *retries >= config_.max_retries) {
                store_.remove(operation_id);
                LOG_ERROR("sync", "Max retries exceeded for operation: %s", operation_id.c_str());
                event.reason = "max_retries";
                event.pending_count = store_.size();
                emit(event);
            }
            break;
        }
    }

    if (pass->cancelled) return;
    process_next(pass);
}

void sync_orchestrator::finish_pass(const std::shared_ptr<sync_pass>& pass) {
    pass->batch.reset();
    current_pass_.reset();

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(scheduler_->now() - pass->started_at);

    if (!online_) {
        set_status(sync_status::offline);
    } else if (pass->error_count == 0) {
        set_status(sync_status::success);
        LOG_INFO("sync", "Sync completed successfully: %d operations", pass->success_count);
    } else {
        set_status(sync_status::error);
        LOG_WARN("sync", "Sync completed with errors: %d failed, %d succeeded",
                 pass->error_count, pass->success_count);
    }

    auto event = make_event(sync_event_type::sync_completed);
    event.success_count = pass->success_count;
    event.error_count = pass->error_count;
    event.duration = duration;
    emit(event);

    if (pass->error_count > 0 && !pass->auth_failed) {
        schedule_retry();
    }
}

void sync_orchestrator::cancel_pass() {
    if (!current_pass_) return;
    LOG_INFO("sync", "Abandoning sync pass in flight");
    current_pass_->cancelled = true;
    current_pass_->batch.reset();
    current_pass_.reset();
}

void sync_orchestrator::handle_realtime_change(const std::string& table, change_kind kind, const record& row) {
    if (!started_) return;

    const auto now = scheduler_->now();
    const auto record_id = record_id_of(row);
    LOG_DEBUG("sync", "Handling realtime change: %s on %s", to_string(kind), table.c_str());

    auto verdict = resolver_.evaluate(store_.list(), table, row, now);
    if (!verdict.empty()) {
        LOG_INFO("sync", "Resolving %zu conflicts using last-write-wins (%zu superseded)",
                 verdict.size(), verdict.discard.size());
        {
            pending_operation_store::batch batch(store_);
            for (const auto& id : verdict.discard) {
                store_.remove(id);
            }
        }
        store_.flush();
    }

    try {
        cache_.apply_change(table, kind, row, now);
    } catch (const std::exception& e) {
        LOG_ERROR("sync", "Failed to update local cache for %s: %s", table.c_str(), e.what());
        auto failed = make_event(sync_event_type::cache_update_failed);
        failed.table = table;
        failed.record_id = record_id;
        failed.change = kind;
        failed.reason = e.what();
        emit(failed);
    }

    last_sync_times_[table] = now;

    auto event = make_event(sync_event_type::realtime_change_processed);
    event.table = table;
    event.record_id = record_id;
    event.change = kind;
    event.conflicts_resolved = verdict.size();
    emit(event);
}

void sync_orchestrator::watch_table(const std::string& subscription_id,
                                    const std::string& table,
                                    std::optional<channel_filter> filter) {
    if (!subscriptions_) {
        throw std::logic_error("watch_table requires a subscription manager");
    }

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    auto route = [this, weak_alive, table](change_kind kind) {
        return [this, weak_alive, table, kind](const record& row) {
            auto alive = weak_alive.lock();
            if (!alive || !*alive) return;
            handle_realtime_change(table, kind, row);
        };
    };

    subscription_config config;
    config.table = table;
    config.filter = std::move(filter);
    config.on_insert = route(change_kind::insert);
    config.on_update = route(change_kind::update);
    config.on_delete = route(change_kind::remove);
    subscriptions_->subscribe(subscription_id, std::move(config));

    if (std::find(watched_subscriptions_.begin(), watched_subscriptions_.end(), subscription_id) ==
        watched_subscriptions_.end()) {
        watched_subscriptions_.push_back(subscription_id);
    }
}

bool sync_orchestrator::needs_sync(const std::string& table, std::optional<std::chrono::milliseconds> max_age) const {
    auto it = last_sync_times_.find(table);
    if (it == last_sync_times_.end()) return true;
    return scheduler_->now() - it->second > max_age.value_or(config_.sync_interval);
}

std::optional<timestamp_t> sync_orchestrator::last_sync_time(const std::string& table) const {
    auto it = last_sync_times_.find(table);
    if (it == last_sync_times_.end()) return std::nullopt;
    return it->second;
}

void sync_orchestrator::clear_pending_operations() {
    store_.clear();
    store_.flush();
    LOG_INFO("sync", "Cleared all pending sync operations");
    emit(make_event(sync_event_type::pending_operations_cleared));
}

void sync_orchestrator::schedule_sync_attempt() {
    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    debounce_timer_ = scheduler_->schedule_after(config_.sync_debounce, [this, weak_alive] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive || !started_) return;
        if (online_) sync();
    });
}

void sync_orchestrator::schedule_retry() {
    if (!started_) return;

    const auto delay = compute_retry_delay(config_, store_.average_retry_count());
    LOG_INFO("sync", "Scheduling retry in %lld ms", static_cast<long long>(delay.count()));

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    retry_timer_ = scheduler_->schedule_after(delay, [this, weak_alive] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive || !started_) return;
        if (online_ && !store_.empty()) sync();
    });
}

void sync_orchestrator::arm_periodic() {
    if (config_.sync_interval.count() <= 0) return;

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    periodic_timer_ = scheduler_->schedule_after(config_.sync_interval, [this, weak_alive] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive || !started_) return;
        if (online_ && !store_.empty()) sync();
        if (started_) arm_periodic();
    });
}

void sync_orchestrator::on_connectivity(const connectivity_event& event) {
    if (!started_) return;

    const bool was_online = online_;
    online_ = event.is_online;

    if (was_online && !online_) {
        LOG_INFO("sync", "Device went offline");
        set_status(sync_status::offline);
    } else if (!was_online && online_) {
        LOG_INFO("sync", "Device came online, triggering sync");
        set_status(current_pass_ ? sync_status::syncing : sync_status::idle);
        schedule_sync_attempt();
        if (subscriptions_) subscriptions_->reconnect_all();
    }

    auto changed = make_event(sync_event_type::connectivity_changed);
    changed.is_online = online_;
    emit(changed);
}

notification_token sync_orchestrator::observe_status(std::function<void(sync_status)> fn) {
    fn(status_);
    return status_changed_.observe([fn = std::move(fn)](const sync_status& status) { fn(status); });
}

notification_token sync_orchestrator::observe_events(std::function<void(const sync_event&)> fn) {
    return events_.observe(std::move(fn));
}

nlohmann::json sync_orchestrator::health_status() const {
    nlohmann::json last_syncs = nlohmann::json::object();
    for (const auto& [table, at] : last_sync_times_) {
        last_syncs[table] = format_timestamp(at);
    }

    nlohmann::json j;
    j["started"] = started_;
    j["current_status"] = to_string(status_);
    j["is_online"] = online_;
    j["is_syncing"] = is_syncing();
    j["pending_operations"] = store_.size();
    j["last_sync_times"] = last_syncs;
    j["config"] = nlohmann::json::parse(config_.to_json());
    j["has_sync_timer"] = has_periodic_timer();
    j["has_retry_timer"] = has_retry_timer();
    j["has_scheduled_sync"] = has_scheduled_sync();
    j["timestamp"] = format_timestamp(scheduler_->now());
    return j;
}

void sync_orchestrator::set_status(sync_status status) {
    if (status_ == status) return;
    LOG_DEBUG("sync", "Status %s -> %s", to_string(status_), to_string(status));
    status_ = status;
    status_changed_.emit(status);
}

sync_event sync_orchestrator::make_event(sync_event_type type) const {
    sync_event event;
    event.type = type;
    event.at = scheduler_->now();
    event.is_online = online_;
    event.pending_count = store_.size();
    return event;
}

void sync_orchestrator::emit(const sync_event& event) {
    events_.emit(event);
}

} // namespace tideline
