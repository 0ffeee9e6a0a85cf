#include "rxsched/run_loop.hpp"
#include "rxsched/detail/spawn_helpers.hpp"
#include "rxsched/detail/timer_queue.hpp"
#include "rxsched/profiling.hpp"

#include <deque>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rxsched {
namespace detail {

//! The loop that is currently run by this thread; null if no loop is running
thread_local const loop_data* g_current_loop{nullptr};

struct loop_data {
    //! The configuration used to create the loop
    loop_config config_;
    //! The tasks ready to be executed
    std::deque<task_function> ready_tasks_;
    //! The tasks waiting for their deadline
    timer_queue delayed_tasks_;
    //! Set when the loop doesn't accept new tasks anymore
    bool stopped_{false};

    explicit loop_data(const loop_config& config)
        : config_(config) {}

    std::size_t num_not_started() const noexcept {
        return ready_tasks_.size() + delayed_tasks_.size();
    }

    //! Moves the delayed tasks that are due into the ready queue
    void release_due_tasks() {
        if (delayed_tasks_.empty())
            return;
        std::vector<task_function> due;
        delayed_tasks_.pop_due(timer_queue::clock::now(), due);
        for (auto& t : due)
            ready_tasks_.emplace_back(std::move(t));
    }

    //! Executes the first ready task; returns false if there is no ready task
    bool run_one() {
        if (ready_tasks_.empty())
            return false;
        auto t = std::move(ready_tasks_.front());
        ready_tasks_.pop_front();
        RXSCHED_PROFILING_SCOPE_N("run_loop task");
        run_work(t, config_.except_fun_);
        return true;
    }
};

namespace {

//! Marks the current thread as running the loop, for the lifetime of the object
struct running_scope {
    const loop_data* prev_;

    explicit running_scope(const loop_data& loop)
        : prev_(g_current_loop) {
        if (prev_ == &loop)
            throw std::logic_error("run_loop cannot be run from within one of its tasks");
        g_current_loop = &loop;
    }
    ~running_scope() { g_current_loop = prev_; }

    running_scope(const running_scope&) = delete;
    running_scope& operator=(const running_scope&) = delete;
};

} // namespace

void loop_spawn(loop_data& loop, deferred_task&& t, local_subscription& sub) {
    RXSCHED_PROFILING_FUNCTION();
    if (loop.stopped_)
        reject_work(sub, submission_failure::stopped);
    if (loop.config_.max_pending_ > 0 && loop.num_not_started() >= loop.config_.max_pending_) {
        // Cancelled delayed tasks don't count against the limit
        loop.delayed_tasks_.purge_aborted();
        if (loop.num_not_started() >= loop.config_.max_pending_)
            reject_work(sub, submission_failure::saturated);
    }

    const bool delayed = t.has_delay();
    const auto deadline = delayed ? timer_queue::clock::now() + *t.delay()
                                  : timer_queue::clock::time_point{};
    auto reg = attach_abort_handle(sub);
    auto work = make_abortable(std::move(t), reg, sub);
    if (delayed)
        loop.delayed_tasks_.push(deadline, std::move(work), std::move(reg));
    else
        loop.ready_tasks_.emplace_back(std::move(work));
}

bool loop_owns_current_thread(const loop_data& loop) noexcept { return g_current_loop == &loop; }

} // namespace detail

inline namespace v1 {

run_loop::run_loop(const loop_config& config)
    : impl_(std::make_unique<detail::loop_data>(config)) {}

run_loop::~run_loop() = default;

run_loop::run_loop(run_loop&&) noexcept = default;
run_loop& run_loop::operator=(run_loop&&) noexcept = default;

local_spawner run_loop::spawner() noexcept { return local_spawner{impl_.get()}; }

void run_loop::run() {
    RXSCHED_PROFILING_FUNCTION();
    detail::running_scope scope{*impl_};
    auto& loop = *impl_;
    while (true) {
        loop.release_due_tasks();
        if (loop.run_one())
            continue;

        // Nothing ready; don't wait for the tasks that were cancelled
        loop.delayed_tasks_.purge_aborted();
        if (loop.delayed_tasks_.empty())
            break;
        std::this_thread::sleep_until(loop.delayed_tasks_.next_deadline());
    }
}

std::size_t run_loop::run_until_stalled() {
    RXSCHED_PROFILING_FUNCTION();
    detail::running_scope scope{*impl_};
    auto& loop = *impl_;
    std::size_t count = 0;
    while (true) {
        loop.release_due_tasks();
        if (!loop.run_one())
            break;
        count++;
    }
    return count;
}

bool run_loop::try_run_one() {
    detail::running_scope scope{*impl_};
    impl_->release_due_tasks();
    return impl_->run_one();
}

void run_loop::stop() {
    impl_->stopped_ = true;
    impl_->ready_tasks_.clear();
    impl_->delayed_tasks_.clear();
}

bool run_loop::is_stopped() const noexcept { return impl_->stopped_; }

std::size_t run_loop::pending() const noexcept { return impl_->num_not_started(); }

} // namespace v1

} // namespace rxsched
