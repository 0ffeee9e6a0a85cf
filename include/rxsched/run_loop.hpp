/**
 * @file    run_loop.hpp
 * @brief   Definition of @ref rxsched::v1::run_loop "run_loop"
 */
#pragma once

#include "config.hpp"
#include "deferred_task.hpp"
#include "subscription.hpp"

#include <cstddef>
#include <memory>

namespace rxsched {

namespace detail {

struct loop_data;

//! Submits work to the loop; throws submission_error if the loop doesn't accept it
void loop_spawn(loop_data& loop, deferred_task&& t, local_subscription& sub);

//! Checks if the current thread is running the given loop
bool loop_owns_current_thread(const loop_data& loop) noexcept;

} // namespace detail

inline namespace v1 {

/**
 * @brief   Handle used to submit work to a @ref run_loop. A *local* scheduler.
 *
 * Cheap to copy. Must be used only from the thread that owns the loop, and cannot exceed the
 * lifetime of the loop that created it.
 */
class local_spawner {
public:
    using subscription_type = local_subscription;

    explicit local_spawner(detail::loop_data* impl) noexcept
        : impl_(impl) {}

    /**
     * @brief   Submits the deferred task to the loop
     *
     * The abort capability is attached to the subscription before the task is added to the loop.
     * The task will be executed by the thread that runs the loop, the next time the loop is run.
     *
     * Throws submission_error if the loop is stopped, or if it reached its pending work limit.
     */
    void spawn(deferred_task t, local_subscription& sub) const {
        detail::loop_spawn(*impl_, std::move(t), sub);
    }

    //! Checks if the current thread is currently running the loop
    bool running_in_this_thread() const noexcept {
        return detail::loop_owns_current_thread(*impl_);
    }

    friend bool operator==(local_spawner l, local_spawner r) noexcept { return l.impl_ == r.impl_; }
    friend bool operator!=(local_spawner l, local_spawner r) noexcept { return l.impl_ != r.impl_; }

private:
    detail::loop_data* impl_;
};

/**
 * @brief   A single-threaded cooperative loop. A *local* scheduler backend.
 *
 * Tasks spawned on this loop are never executed in the background. They are executed by the
 * thread that calls one of the run functions: run(), run_until_stalled() or try_run_one(). Ready
 * tasks are executed in FIFO order; delayed tasks become ready, in deadline order, once their
 * deadline is reached.
 *
 * Cancellation profile:
 *  - the abort capability is attached to the subscription before the task is added to the loop,
 *    so closing the subscription before the task starts guarantees the task won't run
 *  - aborted delayed tasks are dropped before the loop decides to sleep; run() never waits for
 *    the deadline of an aborted task
 *  - a task body that already started runs to completion; there is only one thread, so the only
 *    way to cancel a running task is from within the task itself
 *
 * Exceptions thrown by task bodies are passed to `loop_config::except_fun_`; if this is not set,
 * they propagate out of the run function. The loop remains usable afterwards.
 *
 * @see local_spawner, loop_config
 */
class run_loop {
public:
    explicit run_loop(const loop_config& config = {});
    ~run_loop();

    //! Copy constructor is DISABLED
    run_loop(const run_loop&) = delete;
    //! Copy assignment is DISABLED
    run_loop& operator=(const run_loop&) = delete;

    run_loop(run_loop&&) noexcept;
    run_loop& operator=(run_loop&&) noexcept;

    //! Returns a spawner that can be used to schedule work on this loop
    local_spawner spawner() noexcept;

    /**
     * @brief   Runs the loop until there is no more work.
     *
     * Executes all the ready tasks, and waits for the delayed tasks to become ready, until there
     * is no task left (not even the ones added by the executed tasks).
     *
     * Throws std::logic_error if called from within a task running on this loop.
     */
    void run();

    /**
     * @brief   Runs all the tasks that are ready, without waiting for the delayed ones.
     *
     * @return  The number of tasks taken out of the loop (executed or skipped)
     */
    std::size_t run_until_stalled();

    /**
     * @brief   Runs at most one ready task; doesn't wait.
     *
     * @return  True if a task was taken out of the loop (executed or skipped)
     */
    bool try_run_one();

    /**
     * @brief   Stops the loop.
     *
     * After this, no new work is accepted; spawning throws submission_error. All the tasks that
     * didn't start (including the delayed ones) are dropped; their subscriptions are closed.
     */
    void stop();

    //! Checks if the loop was stopped
    bool is_stopped() const noexcept;

    //! The number of tasks accepted but not yet started; may include cancelled delayed tasks that
    //! were not dropped yet
    std::size_t pending() const noexcept;

private:
    std::unique_ptr<detail::loop_data> impl_;
};

} // namespace v1

} // namespace rxsched
