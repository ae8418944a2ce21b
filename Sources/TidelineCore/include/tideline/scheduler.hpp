#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <map>
#include <condition_variable>
#include <atomic>
#include <chrono>

namespace tideline {

// ============================================================================
// Timer handle - cancels the scheduled callback when destroyed
// ============================================================================
//
// Move-only ownership of a pending delayed callback. Dropping the handle or
// calling cancel() guarantees the callback will not run afterwards (as long
// as both happen on the scheduler's thread).

class timer {
public:
    virtual ~timer() = default;

    virtual void cancel() noexcept = 0;

    /// True until the callback has run or the timer was cancelled.
    [[nodiscard]] virtual bool is_pending() const noexcept = 0;
};

using timer_handle = std::unique_ptr<timer>;

// ============================================================================
// Scheduler interface - the single logical task queue of the sync core
// ============================================================================
//
// Every mutation of core state (pending operations, channel map, orchestrator
// status) runs on one scheduler. Collaborator callbacks that may arrive on
// other threads are re-posted here with invoke(), so code between two
// suspension points never interleaves with another core callback.

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Run fn on this scheduler's context once delay has elapsed.
    virtual timer_handle schedule_after(std::chrono::milliseconds delay, std::function<void()>&& fn) = 0;

    // Current time as seen by this scheduler (virtual for test schedulers).
    [[nodiscard]] virtual timestamp_t now() const = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if this scheduler wraps the same underlying context as another.
    [[nodiscard]] virtual bool is_same_as(const scheduler* other) const noexcept = 0;

    // Check if invoke() is currently possible.
    // May return false if the event loop isn't running.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

namespace detail {

struct timer_state {
    std::atomic<bool> cancelled{false};
    std::atomic<bool> fired{false};
};

struct timed_task {
    std::shared_ptr<timer_state> state;
    std::function<void()> fn;
};

// Ordered by (due time, insertion sequence) so equal deadlines fire FIFO.
using timer_queue = std::map<std::pair<timestamp_t, uint64_t>, timed_task>;

timer_handle make_timer_handle(std::shared_ptr<timer_state> state);

} // namespace detail

// ============================================================================
// Run loop scheduler - runs tasks and timers on a dedicated worker thread
// ============================================================================

class run_loop_scheduler : public scheduler {
public:
    run_loop_scheduler();
    ~run_loop_scheduler() override;

    run_loop_scheduler(const run_loop_scheduler&) = delete;
    run_loop_scheduler& operator=(const run_loop_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override;
    timer_handle schedule_after(std::chrono::milliseconds delay, std::function<void()>&& fn) override;

    [[nodiscard]] timestamp_t now() const override {
        return std::chrono::system_clock::now();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        auto* r = dynamic_cast<const run_loop_scheduler*>(other);
        return r && r->thread_id_ == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop();

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    detail::timer_queue timers_;
    uint64_t timer_seq_ = 0;
    std::atomic<bool> running_;
};

// ============================================================================
// Manual scheduler - virtual clock, pumped by the owner
// ============================================================================
//
// Nothing runs until run_pending() or advance() is called from the owning
// thread. Time only moves through advance(), which fires due timers in
// deadline order. Used by the tests and by hosts that drive their own loop.

class manual_scheduler : public scheduler {
public:
    explicit manual_scheduler(timestamp_t start = truncate_to_millis(std::chrono::system_clock::now()))
        : owner_thread_id_(std::this_thread::get_id()), now_(start) {}

    void invoke(std::function<void()>&& fn) override;
    timer_handle schedule_after(std::chrono::milliseconds delay, std::function<void()>&& fn) override;

    [[nodiscard]] timestamp_t now() const override;

    /// Run queued tasks (including ones queued while running) until the queue is empty.
    /// Returns the number of tasks executed.
    size_t run_pending();

    /// Move the clock forward, firing every timer that falls due on the way.
    void advance(std::chrono::milliseconds by);

    /// Number of timers that have neither fired nor been cancelled.
    [[nodiscard]] size_t pending_timer_count() const;

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return other == this;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

private:
    std::thread::id owner_thread_id_;
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
    detail::timer_queue timers_;
    uint64_t timer_seq_ = 0;
    timestamp_t now_;
};

} // namespace tideline
