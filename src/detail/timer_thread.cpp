#include "rxsched/detail/timer_thread.hpp"
#include "rxsched/profiling.hpp"

#include <utility>
#include <vector>

namespace rxsched {
namespace detail {

timer_thread::timer_thread(due_fun on_due, dropped_fun on_dropped)
    : on_due_(std::move(on_due))
    , on_dropped_(std::move(on_dropped))
    , state_(std::make_shared<state>()) {
    thread_ = std::thread([this] { run(); });
}

timer_thread::~timer_thread() { stop(); }

bool timer_thread::add(clock::time_point deadline, task_function work, const abort_registration& reg) {
    RXSCHED_PROFILING_FUNCTION();
    {
        std::lock_guard<std::mutex> lock{state_->bottleneck_};
        if (state_->done_)
            return false;
        state_->queue_.push(deadline, std::move(work), reg);
    }
    state_->wakeup_.notify_one();

    // Wake up the timer thread when the work is aborted, so that it's dropped early
    std::weak_ptr<state> weak_state = state_;
    abort_registration{reg}.on_abort([weak_state] {
        if (auto s = weak_state.lock()) {
            {
                std::lock_guard<std::mutex> lock{s->bottleneck_};
                s->has_aborted_ = true;
            }
            s->wakeup_.notify_one();
        }
    });
    return true;
}

void timer_thread::stop() {
    // Dropping work closes subscriptions; release it without holding the lock
    timer_queue dropped;
    {
        std::lock_guard<std::mutex> lock{state_->bottleneck_};
        if (!state_->done_) {
            state_->done_ = true;
            std::swap(dropped, state_->queue_);
        }
    }
    const std::size_t num_dropped = dropped.clear();
    state_->wakeup_.notify_all();
    if (thread_.joinable()) {
        // The owner may be released from one of our own callbacks
        if (thread_.get_id() == std::this_thread::get_id())
            thread_.detach();
        else
            thread_.join();
    }
    if (num_dropped > 0)
        on_dropped_(num_dropped);
}

void timer_thread::run() {
    RXSCHED_PROFILING_SETTHREADNAME("rxsched_timer");
    auto keep_alive = state_;
    auto& s = *keep_alive;
    std::vector<task_function> due;
    std::unique_lock<std::mutex> lock{s.bottleneck_};
    while (!s.done_) {
        std::size_t num_dropped = 0;
        if (s.has_aborted_) {
            s.has_aborted_ = false;
            num_dropped = s.queue_.purge_aborted();
        }
        if (num_dropped == 0 && s.queue_.empty()) {
            s.wakeup_.wait(lock, [&s] { return s.done_ || s.has_aborted_ || !s.queue_.empty(); });
            continue;
        }
        if (num_dropped == 0) {
            auto deadline = s.queue_.next_deadline();
            if (clock::now() < deadline) {
                s.wakeup_.wait_until(lock, deadline);
                continue;
            }
            num_dropped = s.queue_.pop_due(clock::now(), due);
        }

        // Release the work without holding the lock
        lock.unlock();
        if (num_dropped > 0)
            on_dropped_(num_dropped);
        for (auto& w : due)
            on_due_(std::move(w));
        due.clear();
        lock.lock();
    }
}

} // namespace detail
} // namespace rxsched
