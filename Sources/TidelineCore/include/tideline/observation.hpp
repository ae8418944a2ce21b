#pragma once

#include <vector>
#include <functional>
#include <memory>
#include <utility>
#include <cstdint>

namespace tideline {

// ============================================================================
// notification_token - Retains observation until destroyed (move-only)
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Explicitly unregister the observation
    void unregister() {
        if (unregister_) {
            unregister_();
            unregister_ = nullptr;
        }
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// observable<T> - Multi-subscriber event stream
// ============================================================================
//
// Not thread-safe: observe/emit/unregister are expected on the owning
// scheduler. Handlers are snapshotted before each emit so a handler may
// unregister itself (or others) while being called. Tokens outliving the
// observable are harmless.

template<typename T>
class observable {
public:
    using handler = std::function<void(const T&)>;

    observable() : state_(std::make_shared<state>()) {}

    observable(const observable&) = delete;
    observable& operator=(const observable&) = delete;

    [[nodiscard]] notification_token observe(handler h) {
        const uint64_t id = ++state_->next_id;
        state_->handlers.emplace_back(id, std::move(h));
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id] {
            if (auto s = weak.lock()) {
                s->erase(id);
            }
        });
    }

    void emit(const T& value) const {
        auto s = state_;
        auto snapshot = s->handlers;
        for (auto& [id, h] : snapshot) {
            // Skip handlers removed by an earlier handler in this emit
            if (h && s->contains(id)) {
                h(value);
            }
        }
    }

    [[nodiscard]] size_t observer_count() const noexcept {
        return state_->handlers.size();
    }

private:
    struct state {
        uint64_t next_id = 0;
        std::vector<std::pair<uint64_t, handler>> handlers;

        void erase(uint64_t id) {
            std::erase_if(handlers, [id](const auto& entry) { return entry.first == id; });
        }

        bool contains(uint64_t id) const {
            for (const auto& entry : handlers) {
                if (entry.first == id) return true;
            }
            return false;
        }
    };

    std::shared_ptr<state> state_;
};

} // namespace tideline
