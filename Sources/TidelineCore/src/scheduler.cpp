#include "tideline/scheduler.hpp"

namespace tideline {

namespace detail {

namespace {

class scheduled_timer : public timer {
public:
    explicit scheduled_timer(std::shared_ptr<timer_state> state) : state_(std::move(state)) {}

    ~scheduled_timer() override {
        cancel();
    }

    void cancel() noexcept override {
        state_->cancelled = true;
    }

    [[nodiscard]] bool is_pending() const noexcept override {
        return !state_->cancelled && !state_->fired;
    }

private:
    std::shared_ptr<timer_state> state_;
};

// Claim a timed task for execution. Returns false if it was cancelled first.
bool claim(const timed_task& task) {
    if (task.state->cancelled) return false;
    task.state->fired = true;
    return true;
}

} // namespace

timer_handle make_timer_handle(std::shared_ptr<timer_state> state) {
    return std::make_unique<scheduled_timer>(std::move(state));
}

} // namespace detail

// ============================================================================
// run_loop_scheduler
// ============================================================================

run_loop_scheduler::run_loop_scheduler() : running_(true) {
    worker_ = std::thread([this] { run_loop(); });
    thread_id_ = worker_.get_id();
}

run_loop_scheduler::~run_loop_scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void run_loop_scheduler::invoke(std::function<void()>&& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        queue_.push(std::move(fn));
    }
    cv_.notify_one();
}

timer_handle run_loop_scheduler::schedule_after(std::chrono::milliseconds delay, std::function<void()>&& fn) {
    auto state = std::make_shared<detail::timer_state>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            state->cancelled = true;
        } else {
            timers_.emplace(std::make_pair(now() + delay, timer_seq_++),
                            detail::timed_task{state, std::move(fn)});
        }
    }
    cv_.notify_one();
    return detail::make_timer_handle(std::move(state));
}

void run_loop_scheduler::run_loop() {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (!running_ && queue_.empty()) {
                    return;
                }
                if (!queue_.empty()) {
                    fn = std::move(queue_.front());
                    queue_.pop();
                    break;
                }
                if (timers_.empty()) {
                    cv_.wait(lock);
                    continue;
                }

                auto first = timers_.begin();
                if (first->second.state->cancelled) {
                    timers_.erase(first);
                    continue;
                }
                if (first->first.first <= now()) {
                    auto task = std::move(first->second);
                    timers_.erase(first);
                    if (detail::claim(task)) {
                        fn = std::move(task.fn);
                        break;
                    }
                    continue;
                }
                cv_.wait_until(lock, first->first.first);
            }
        }

        if (fn) {
            fn();
        }
    }
}

// ============================================================================
// manual_scheduler
// ============================================================================

void manual_scheduler::invoke(std::function<void()>&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(fn));
}

timer_handle manual_scheduler::schedule_after(std::chrono::milliseconds delay, std::function<void()>&& fn) {
    auto state = std::make_shared<detail::timer_state>();
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.emplace(std::make_pair(now_ + delay, timer_seq_++),
                    detail::timed_task{state, std::move(fn)});
    return detail::make_timer_handle(std::move(state));
}

timestamp_t manual_scheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

size_t manual_scheduler::run_pending() {
    size_t executed = 0;
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) break;
            fn = std::move(queue_.front());
            queue_.pop();
        }
        if (fn) {
            fn();
        }
        ++executed;
    }
    return executed;
}

void manual_scheduler::advance(std::chrono::milliseconds by) {
    timestamp_t target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + by;
    }

    run_pending();
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (timers_.empty()) break;
            auto first = timers_.begin();
            if (first->first.first > target) break;

            auto due = first->first.first;
            auto task = std::move(first->second);
            timers_.erase(first);
            if (!detail::claim(task)) continue;
            if (due > now_) now_ = due;
            fn = std::move(task.fn);
        }
        if (fn) {
            fn();
        }
        run_pending();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = target;
    }
    run_pending();
}

size_t manual_scheduler::pending_timer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [key, task] : timers_) {
        if (!task.state->cancelled) ++count;
    }
    return count;
}

} // namespace tideline
