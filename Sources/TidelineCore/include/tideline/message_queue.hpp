#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tideline {

class kv_store;

struct message_queue_config {
    int max_retry_attempts = 3;
    std::chrono::milliseconds retry_delay = std::chrono::seconds(5);
    std::chrono::milliseconds stale_threshold = std::chrono::hours(24);
    std::string queue_key = "offline_message_queue";
    std::string failed_key = "offline_message_failed";

    static std::optional<message_queue_config> from_json(const std::string& json);
    std::string to_json() const;
};

struct queued_message {
    record message;                          ///< must carry an "id"
    std::optional<nlohmann::json> context;
    timestamp_t queued_at;
    int retry_count = 0;

    std::string id() const { return record_id_of(message).value_or(""); }

    bool is_stale(timestamp_t now, std::chrono::milliseconds threshold = std::chrono::hours(24)) const {
        return now - queued_at > threshold;
    }

    /// "Queued for sending" or "Retry attempt N".
    std::string status_description() const;

    nlohmann::json to_json() const;
    static std::optional<queued_message> from_json(const nlohmann::json& json);

    bool operator==(const queued_message&) const = default;
};

// ============================================================================
// offline_message_queue - Outgoing messages held while offline
// ============================================================================
//
// Messages that fail max_retry_attempts times move to a separate failed
// bucket (dead letters) instead of being dropped. Both buckets persist to the
// kv_store after every change. Call from the scheduler's context.

class offline_message_queue {
public:
    using send_completion = std::function<void(std::exception_ptr)>;
    using sender = std::function<void(const queued_message& message, send_completion done)>;

    offline_message_queue(SharedScheduler scheduler, kv_store& store, message_queue_config config = {});
    ~offline_message_queue();

    offline_message_queue(const offline_message_queue&) = delete;
    offline_message_queue& operator=(const offline_message_queue&) = delete;

    /// Throws std::invalid_argument if message has no id. Returns false if
    /// a message with that id is already queued.
    bool queue_message(record message, std::optional<nlohmann::json> context = std::nullopt);

    /// Returns false if the id was not queued.
    bool remove_message(const std::string& message_id);

    [[nodiscard]] std::vector<queued_message> queued_messages() const { return queue_; }
    [[nodiscard]] size_t queued_message_count() const noexcept { return queue_.size(); }
    [[nodiscard]] bool is_message_queued(const std::string& message_id) const;

    [[nodiscard]] int retry_count(const std::string& message_id) const;
    [[nodiscard]] bool has_exceeded_retry_limit(const std::string& message_id) const;
    [[nodiscard]] std::vector<queued_message> messages_ready_for_retry() const;

    /// Queued messages older than the stale threshold (not removed).
    [[nodiscard]] std::vector<queued_message> stale_messages(timestamp_t now) const;
    [[nodiscard]] std::vector<queued_message> stale_messages() const { return stale_messages(scheduler_->now()); }

    [[nodiscard]] std::vector<queued_message> failed_messages() const { return failed_; }

    /// Move a failed message back to the queue with a fresh retry budget.
    bool requeue_failed(const std::string& message_id);
    bool discard_failed(const std::string& message_id);

    /// Drop both the queue and the failed bucket.
    void clear_queue();

    /// Replace both buckets with the stored ones. Returns the number of queued messages.
    size_t load();

    /// Send a snapshot of the queue in order, one message at a time.
    /// No-op while a pass is running or when the queue is empty.
    void process_queue(sender send);

    [[nodiscard]] bool is_processing() const noexcept { return processing_; }
    [[nodiscard]] bool has_retry_timer() const { return retry_timer_ && retry_timer_->is_pending(); }
    [[nodiscard]] const message_queue_config& config() const noexcept { return config_; }

private:
    struct queue_pass {
        sender send;
        std::vector<std::string> snapshot;
        size_t index = 0;
        std::optional<std::chrono::milliseconds> retry_after;
    };

    void process_next(const std::shared_ptr<queue_pass>& pass);
    void on_send_result(const std::shared_ptr<queue_pass>& pass, const std::string& message_id, std::exception_ptr error);
    void schedule_retry(std::chrono::milliseconds delay);
    void save();

    std::vector<queued_message>::iterator find_queued(const std::string& message_id);

    SharedScheduler scheduler_;
    kv_store& store_;
    message_queue_config config_;

    std::vector<queued_message> queue_;
    std::vector<queued_message> failed_;
    bool processing_ = false;
    sender last_sender_;
    timer_handle retry_timer_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace tideline

#endif // __cplusplus
