#include "tideline/message_queue.hpp"
#include "tideline/kv_store.hpp"
#include "tideline/log.hpp"
#include "tideline/remote.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace tideline {

// ============================================================================
// message_queue_config
// ============================================================================

std::optional<message_queue_config> message_queue_config::from_json(const std::string& json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("message_queue", "Invalid message queue config JSON");
        return std::nullopt;
    }

    message_queue_config config;
    if (j.contains("max_retry_attempts") && j["max_retry_attempts"].is_number_integer()) {
        config.max_retry_attempts = j["max_retry_attempts"].get<int>();
    }
    if (j.contains("retry_delay") && j["retry_delay"].is_number()) {
        config.retry_delay = std::chrono::milliseconds(static_cast<int64_t>(j["retry_delay"].get<double>() * 1000));
    }
    if (j.contains("stale_threshold") && j["stale_threshold"].is_number()) {
        config.stale_threshold = std::chrono::milliseconds(static_cast<int64_t>(j["stale_threshold"].get<double>() * 1000));
    }
    if (j.contains("queue_key") && j["queue_key"].is_string()) {
        config.queue_key = j["queue_key"].get<std::string>();
    }
    if (j.contains("failed_key") && j["failed_key"].is_string()) {
        config.failed_key = j["failed_key"].get<std::string>();
    }
    return config;
}

std::string message_queue_config::to_json() const {
    nlohmann::json j;
    j["max_retry_attempts"] = max_retry_attempts;
    j["retry_delay"] = static_cast<double>(retry_delay.count()) / 1000.0;
    j["stale_threshold"] = static_cast<double>(stale_threshold.count()) / 1000.0;
    j["queue_key"] = queue_key;
    j["failed_key"] = failed_key;
    return j.dump();
}

// ============================================================================
// queued_message
// ============================================================================

std::string queued_message::status_description() const {
    if (retry_count == 0) {
        return "Queued for sending";
    }
    return "Retry attempt " + std::to_string(retry_count);
}

nlohmann::json queued_message::to_json() const {
    nlohmann::json j;
    j["message"] = message;
    j["context"] = context ? *context : nlohmann::json(nullptr);
    j["queued_at"] = format_timestamp(queued_at);
    j["retry_count"] = retry_count;
    return j;
}

std::optional<queued_message> queued_message::from_json(const nlohmann::json& json) {
    if (!json.is_object()) return std::nullopt;

    auto message = json.find("message");
    auto queued_at = json.find("queued_at");
    if (message == json.end() || !message->is_object() || !record_id_of(*message)) return std::nullopt;
    if (queued_at == json.end() || !queued_at->is_string()) return std::nullopt;

    auto when = parse_timestamp(queued_at->get<std::string>());
    if (!when) return std::nullopt;

    queued_message result;
    result.message = *message;
    result.queued_at = *when;
    if (auto it = json.find("context"); it != json.end() && !it->is_null()) {
        result.context = *it;
    }
    if (auto it = json.find("retry_count"); it != json.end() && it->is_number_integer()) {
        result.retry_count = std::max(0, it->get<int>());
    }
    return result;
}

// ============================================================================
// offline_message_queue
// ============================================================================

offline_message_queue::offline_message_queue(SharedScheduler scheduler, kv_store& store, message_queue_config config)
    : scheduler_(std::move(scheduler))
    , store_(store)
    , config_(std::move(config))
    , alive_(std::make_shared<std::atomic<bool>>(true)) {}

offline_message_queue::~offline_message_queue() {
    *alive_ = false;
    retry_timer_.reset();
}

std::vector<queued_message>::iterator offline_message_queue::find_queued(const std::string& message_id) {
    return std::find_if(queue_.begin(), queue_.end(),
                        [&](const queued_message& m) { return m.id() == message_id; });
}

bool offline_message_queue::queue_message(record message, std::optional<nlohmann::json> context) {
    auto id = record_id_of(message);
    if (!id || id->empty()) {
        throw std::invalid_argument("Queued message requires an id");
    }
    if (is_message_queued(*id)) {
        LOG_DEBUG("message_queue", "Message %s is already queued", id->c_str());
        return false;
    }

    queued_message entry;
    entry.message = std::move(message);
    entry.context = std::move(context);
    entry.queued_at = truncate_to_millis(scheduler_->now());
    queue_.push_back(std::move(entry));
    save();

    LOG_INFO("message_queue", "Message queued for offline sending: %s", id->c_str());
    return true;
}

bool offline_message_queue::remove_message(const std::string& message_id) {
    auto it = find_queued(message_id);
    if (it == queue_.end()) return false;
    queue_.erase(it);
    save();
    LOG_INFO("message_queue", "Message removed from queue: %s", message_id.c_str());
    return true;
}

bool offline_message_queue::is_message_queued(const std::string& message_id) const {
    return std::any_of(queue_.begin(), queue_.end(),
                       [&](const queued_message& m) { return m.id() == message_id; });
}

int offline_message_queue::retry_count(const std::string& message_id) const {
    for (const auto* bucket : {&queue_, &failed_}) {
        for (const auto& m : *bucket) {
            if (m.id() == message_id) return m.retry_count;
        }
    }
    return 0;
}

bool offline_message_queue::has_exceeded_retry_limit(const std::string& message_id) const {
    return retry_count(message_id) >= config_.max_retry_attempts;
}

std::vector<queued_message> offline_message_queue::messages_ready_for_retry() const {
    std::vector<queued_message> ready;
    std::copy_if(queue_.begin(), queue_.end(), std::back_inserter(ready),
                 [&](const queued_message& m) { return m.retry_count < config_.max_retry_attempts; });
    return ready;
}

std::vector<queued_message> offline_message_queue::stale_messages(timestamp_t now) const {
    std::vector<queued_message> stale;
    std::copy_if(queue_.begin(), queue_.end(), std::back_inserter(stale),
                 [&](const queued_message& m) { return m.is_stale(now, config_.stale_threshold); });
    return stale;
}

bool offline_message_queue::requeue_failed(const std::string& message_id) {
    auto it = std::find_if(failed_.begin(), failed_.end(),
                           [&](const queued_message& m) { return m.id() == message_id; });
    if (it == failed_.end()) return false;

    queued_message entry = std::move(*it);
    failed_.erase(it);
    entry.retry_count = 0;
    if (!is_message_queued(message_id)) {
        queue_.push_back(std::move(entry));
    }
    save();
    LOG_INFO("message_queue", "Failed message requeued: %s", message_id.c_str());
    return true;
}

bool offline_message_queue::discard_failed(const std::string& message_id) {
    auto removed = std::erase_if(failed_, [&](const queued_message& m) { return m.id() == message_id; });
    if (removed == 0) return false;
    save();
    return true;
}

void offline_message_queue::clear_queue() {
    queue_.clear();
    failed_.clear();
    retry_timer_.reset();
    save();
    LOG_INFO("message_queue", "Offline message queue cleared");
}

size_t offline_message_queue::load() {
    auto read_bucket = [&](const std::string& key, std::vector<queued_message>& out) {
        auto stored = read_json(store_, key);
        if (!stored) return;
        if (!stored->is_array()) {
            LOG_WARN("message_queue", "Ignoring %s: not an array", key.c_str());
            return;
        }
        out.clear();
        for (const auto& entry : *stored) {
            if (auto message = queued_message::from_json(entry)) {
                out.push_back(std::move(*message));
            } else {
                LOG_WARN("message_queue", "Skipping unparsable queued message in %s", key.c_str());
            }
        }
    };

    try {
        read_bucket(config_.queue_key, queue_);
        read_bucket(config_.failed_key, failed_);
    } catch (const storage_error& e) {
        LOG_ERROR("message_queue", "Failed to load offline message queue: %s", e.what());
    }

    LOG_INFO("message_queue", "Loaded offline message queue: %zu messages (%zu failed)", queue_.size(), failed_.size());
    return queue_.size();
}

void offline_message_queue::save() {
    auto to_array = [](const std::vector<queued_message>& bucket) {
        auto array = nlohmann::json::array();
        for (const auto& m : bucket) array.push_back(m.to_json());
        return array;
    };

    try {
        write_json(store_, config_.queue_key, to_array(queue_));
        write_json(store_, config_.failed_key, to_array(failed_));
    } catch (const storage_error& e) {
        LOG_ERROR("message_queue", "Failed to save offline message queue: %s", e.what());
    }
}

void offline_message_queue::process_queue(sender send) {
    if (!send) {
        throw std::invalid_argument("process_queue requires a sender");
    }
    if (processing_ || queue_.empty()) return;

    processing_ = true;
    last_sender_ = send;
    retry_timer_.reset();
    LOG_INFO("message_queue", "Processing offline message queue: %zu messages", queue_.size());

    auto pass = std::make_shared<queue_pass>();
    pass->send = std::move(send);
    for (const auto& m : queue_) pass->snapshot.push_back(m.id());
    process_next(pass);
}

void offline_message_queue::process_next(const std::shared_ptr<queue_pass>& pass) {
    while (pass->index < pass->snapshot.size()) {
        const auto& message_id = pass->snapshot[pass->index];
        auto it = find_queued(message_id);
        if (it == queue_.end()) {
            ++pass->index;
            continue;
        }

        std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
        auto done = [this, weak_alive, pass, message_id](std::exception_ptr error) {
            scheduler_->invoke([this, weak_alive, pass, message_id, error] {
                auto alive = weak_alive.lock();
                if (!alive || !*alive) return;
                on_send_result(pass, message_id, error);
            });
        };

        const queued_message message = *it;
        try {
            pass->send(message, done);
        } catch (const std::exception& e) {
            LOG_WARN("message_queue", "Sender threw for %s: %s", message_id.c_str(), e.what());
            done(std::current_exception());
        }
        return;
    }

    processing_ = false;
    if (pass->retry_after) {
        schedule_retry(*pass->retry_after);
    }
}

void offline_message_queue::on_send_result(const std::shared_ptr<queue_pass>& pass,
                                           const std::string& message_id,
                                           std::exception_ptr error) {
    if (pass->index >= pass->snapshot.size() || pass->snapshot[pass->index] != message_id) {
        LOG_WARN("message_queue", "Ignoring unexpected completion for %s", message_id.c_str());
        return;
    }
    ++pass->index;

    auto it = find_queued(message_id);
    if (!error) {
        if (it != queue_.end()) {
            queue_.erase(it);
            save();
        }
        LOG_INFO("message_queue", "Successfully sent queued message: %s", message_id.c_str());
        process_next(pass);
        return;
    }

    if (it == queue_.end()) {
        process_next(pass);
        return;
    }

    const auto failure = classify_error(error);
    const int attempts = ++it->retry_count;
    if (attempts >= config_.max_retry_attempts) {
        LOG_ERROR("message_queue", "Max retry attempts reached for message %s, moving to failed", message_id.c_str());
        failed_.push_back(std::move(*it));
        queue_.erase(it);
    } else {
        LOG_WARN("message_queue", "Failed to send message %s (attempt %d/%d): %s",
                 message_id.c_str(), attempts, config_.max_retry_attempts, failure.message.c_str());
        pass->retry_after = config_.retry_delay * attempts;
    }
    save();
    process_next(pass);
}

void offline_message_queue::schedule_retry(std::chrono::milliseconds delay) {
    LOG_INFO("message_queue", "Scheduling queue retry in %lld ms", static_cast<long long>(delay.count()));

    std::weak_ptr<std::atomic<bool>> weak_alive = alive_;
    retry_timer_ = scheduler_->schedule_after(delay, [this, weak_alive] {
        auto alive = weak_alive.lock();
        if (!alive || !*alive || !last_sender_) return;
        process_queue(last_sender_);
    });
}

} // namespace tideline
