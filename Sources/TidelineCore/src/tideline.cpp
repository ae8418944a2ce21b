#include "tideline/tideline.hpp"

namespace tideline {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

// ============================================================================
// engine_config
// ============================================================================

std::optional<engine_config> engine_config::from_json(const std::string& json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("sync", "Invalid engine config JSON");
        return std::nullopt;
    }

    engine_config config;
    if (j.contains("storage_path") && j["storage_path"].is_string()) {
        config.storage_path = j["storage_path"].get<std::string>();
    }
    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) return std::nullopt;
        config.log = parse_log_level(j["log_level"].get<std::string>());
        if (!config.log) {
            LOG_WARN("sync", "Unknown log level in engine config");
            return std::nullopt;
        }
    }

    // Each section falls back to its defaults when absent; a malformed section fails the whole config
    auto section = [&](const char* key, auto& out) -> bool {
        if (!j.contains(key)) return true;
        using section_t = std::decay_t<decltype(out)>;
        auto parsed = section_t::from_json(j[key].dump());
        if (!parsed) return false;
        out = std::move(*parsed);
        return true;
    };

    if (!section("sync", config.sync) ||
        !section("reconnect", config.reconnect) ||
        !section("messages", config.messages) ||
        !section("connectivity", config.connectivity)) {
        return std::nullopt;
    }
    return config;
}

std::string engine_config::to_json() const {
    nlohmann::json j;
    j["storage_path"] = storage_path;
    if (log) j["log_level"] = to_string(*log);
    j["sync"] = nlohmann::json::parse(sync.to_json());
    j["reconnect"] = nlohmann::json::parse(reconnect.to_json());
    j["messages"] = nlohmann::json::parse(messages.to_json());
    j["connectivity"] = nlohmann::json::parse(connectivity.to_json());
    return j.dump();
}

// ============================================================================
// sync_engine
// ============================================================================

sync_engine::sync_engine(engine_config config,
                         SharedScheduler scheduler,
                         remote_data_api& remote,
                         realtime_transport& transport,
                         connectivity_source& source,
                         reachability_probe probe)
    : config_(std::move(config))
    , scheduler_(std::move(scheduler)) {
    if (config_.log) set_log_level(*config_.log);
    storage_ = std::make_unique<sqlite_kv_store>(config_.storage_path);
    cache_ = std::make_unique<kv_local_cache>(*storage_);
    connectivity_ = std::make_unique<connectivity_monitor>(scheduler_, source, config_.connectivity, std::move(probe));
    subscriptions_ = std::make_unique<subscription_manager>(scheduler_, transport, config_.reconnect);
    orchestrator_ = std::make_unique<sync_orchestrator>(scheduler_, remote, *storage_, *cache_, *connectivity_,
                                                        config_.sync, subscriptions_.get());
    messages_ = std::make_unique<offline_message_queue>(scheduler_, *storage_, config_.messages);
}

sync_engine::~sync_engine() {
    stop();
}

void sync_engine::start() {
    if (started_) return;
    started_ = true;

    LOG_INFO("sync", "Starting sync engine (storage: %s)", config_.storage_path.c_str());
    connectivity_->start();
    messages_->load();
    orchestrator_->start();

    reconnect_token_ = connectivity_->observe([this](const connectivity_event& event) {
        if (event.is_online && message_sender_) {
            messages_->process_queue(message_sender_);
        }
    });
}

void sync_engine::stop() {
    if (!started_) return;
    started_ = false;

    reconnect_token_.unregister();
    orchestrator_->stop();
    subscriptions_->unsubscribe_all();
    connectivity_->stop();
    LOG_INFO("sync", "Sync engine stopped");
}

nlohmann::json sync_engine::health_status() const {
    nlohmann::json j;
    j["sync"] = orchestrator_->health_status();
    j["realtime"] = subscriptions_->health_status();
    j["connectivity"] = {
        {"is_online", connectivity_->is_online()},
        {"transitions", connectivity_->transition_count()}
    };
    j["messages"] = {
        {"queued", messages_->queued_message_count()},
        {"failed", messages_->failed_messages().size()},
        {"stale", messages_->stale_messages().size()}
    };
    return j;
}

} // namespace tideline
