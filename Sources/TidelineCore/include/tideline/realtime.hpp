#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tideline {

// ============================================================================
// Push transport - per-table change notifications
// ============================================================================

/// Asynchronous acknowledgment of a channel subscription.
enum class channel_status : int {
    subscribed = 0,
    timed_out = 1,
    channel_error = 2,
    closed = 3
};

const char* to_string(channel_status status) noexcept;

/// Equality filter on one column, written "column=value".
struct channel_filter {
    std::string column;
    std::string value;

    /// Returns nullopt unless text has a non-empty column before the first '='.
    static std::optional<channel_filter> parse(std::string_view text);

    /// True if row[column] equals value (numbers and booleans compare by their JSON text).
    bool matches(const record& row) const;

    std::string to_string() const { return column + "=" + value; }
};

class realtime_channel {
public:
    using change_handler = std::function<void(const record&)>;
    using status_handler = std::function<void(channel_status status, const std::string& error)>;

    virtual ~realtime_channel() = default;

    virtual const std::string& name() const = 0;

    // Handlers must be registered before subscribe()
    virtual void on_insert(change_handler handler) = 0;
    virtual void on_update(change_handler handler) = 0;
    virtual void on_delete(change_handler handler) = 0;

    // Start listening. The handler may be called more than once and on any thread.
    virtual void subscribe(status_handler handler) = 0;

    // Stop delivery. No handler is called after close() returns.
    virtual void close() = 0;
};

using SharedRealtimeChannel = std::shared_ptr<realtime_channel>;

class realtime_transport {
public:
    virtual ~realtime_transport() = default;

    virtual SharedRealtimeChannel open_channel(const std::string& name,
                                               const std::string& table,
                                               const std::optional<channel_filter>& filter) = 0;
};

// ============================================================================
// Mock implementations for testing
// ============================================================================

class mock_realtime_channel : public realtime_channel {
public:
    mock_realtime_channel(std::string name, std::string table, std::optional<channel_filter> filter)
        : name_(std::move(name)), table_(std::move(table)), filter_(std::move(filter)) {}

    const std::string& name() const override { return name_; }

    void on_insert(change_handler handler) override { on_insert_ = std::move(handler); }
    void on_update(change_handler handler) override { on_update_ = std::move(handler); }
    void on_delete(change_handler handler) override { on_delete_ = std::move(handler); }

    void subscribe(status_handler handler) override {
        status_handler_ = std::move(handler);
        subscribed_ = true;
        if (auto_status_) simulate_status(*auto_status_);
    }

    void close() override {
        closed_ = true;
        status_handler_ = nullptr;
        on_insert_ = on_update_ = on_delete_ = nullptr;
    }

    // Test helpers
    void set_auto_status(std::optional<channel_status> status) { auto_status_ = status; }

    void simulate_status(channel_status status, const std::string& error = {}) {
        if (closed_ || !status_handler_) return;
        auto handler = status_handler_;
        handler(status, error);
    }

    /// Deliver a change, applying the channel filter the way a server would.
    void simulate_change(change_kind kind, const record& row) {
        if (closed_ || !subscribed_) return;
        if (filter_ && !filter_->matches(row)) return;
        change_handler handler;
        switch (kind) {
            case change_kind::insert: handler = on_insert_; break;
            case change_kind::update: handler = on_update_; break;
            case change_kind::remove: handler = on_delete_; break;
        }
        if (handler) handler(row);
    }

    const std::string& table() const { return table_; }
    const std::optional<channel_filter>& filter() const { return filter_; }
    bool is_closed() const { return closed_; }
    bool is_subscribed() const { return subscribed_; }

private:
    std::string name_;
    std::string table_;
    std::optional<channel_filter> filter_;
    change_handler on_insert_;
    change_handler on_update_;
    change_handler on_delete_;
    status_handler status_handler_;
    std::optional<channel_status> auto_status_;
    bool subscribed_ = false;
    bool closed_ = false;
};

class mock_realtime_transport : public realtime_transport {
public:
    SharedRealtimeChannel open_channel(const std::string& name,
                                       const std::string& table,
                                       const std::optional<channel_filter>& filter) override {
        auto channel = std::make_shared<mock_realtime_channel>(name, table, filter);
        channel->set_auto_status(auto_status_);
        channels_.push_back(channel);
        return channel;
    }

    // Test helpers

    /// Status every newly subscribed channel acknowledges with (nullopt = stay silent).
    void set_auto_status(std::optional<channel_status> status) { auto_status_ = status; }

    /// Most recently opened channel with this name that is still open.
    std::shared_ptr<mock_realtime_channel> channel(const std::string& name) const {
        for (auto it = channels_.rbegin(); it != channels_.rend(); ++it) {
            if ((*it)->name() == name && !(*it)->is_closed()) return *it;
        }
        return nullptr;
    }

    /// Deliver a change to every open channel on table.
    void emit(const std::string& table, change_kind kind, const record& row) {
        auto snapshot = channels_;
        for (auto& ch : snapshot) {
            if (ch->table() == table) ch->simulate_change(kind, row);
        }
    }

    size_t open_count() const { return channels_.size(); }

    size_t active_count() const {
        size_t count = 0;
        for (const auto& ch : channels_) {
            if (!ch->is_closed()) ++count;
        }
        return count;
    }

private:
    std::vector<std::shared_ptr<mock_realtime_channel>> channels_;
    std::optional<channel_status> auto_status_ = channel_status::subscribed;
};

} // namespace tideline

#endif // __cplusplus
