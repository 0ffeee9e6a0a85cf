/**
 * @file    thread_pool.hpp
 * @brief   Definition of @ref rxsched::v1::thread_pool "thread_pool"
 */
#pragma once

#include "config.hpp"
#include "deferred_task.hpp"
#include "subscription.hpp"

#include <cstddef>
#include <memory>

namespace rxsched {

inline namespace v1 {
class thread_pool;
}

namespace detail {

struct pool_data;

//! Submits work to the pool; throws submission_error if the pool doesn't accept it
void pool_spawn(pool_data& pool, deferred_task&& t, shared_subscription& sub);

//! Checks if the current thread is one of the pool's workers
bool pool_owns_current_thread(const pool_data& pool) noexcept;

//! The scheduler type exposed by the thread pool
class thread_pool_scheduler {
public:
    using subscription_type = shared_subscription;

    explicit thread_pool_scheduler(pool_data* impl) noexcept
        : impl_(impl) {}

    /**
     * @brief   Submits the deferred task to the thread pool
     *
     * @param   t       The task to be executed
     * @param   sub     The subscription that receives the abort capability for the task
     *
     * The abort capability is attached to the subscription before the task is enqueued. If the
     * task has a delay, it is kept by the pool's timer until the deadline, and only then enqueued.
     *
     * Throws submission_error if the pool is stopped, or if it reached its pending work limit.
     */
    void spawn(deferred_task t, shared_subscription& sub) const {
        pool_spawn(*impl_, std::move(t), sub);
    }

    //! Checks if the current thread is one of the pool's workers
    bool running_in_this_thread() const noexcept { return pool_owns_current_thread(*impl_); }

    friend bool operator==(thread_pool_scheduler l, thread_pool_scheduler r) noexcept {
        return l.impl_ == r.impl_;
    }
    friend bool operator!=(thread_pool_scheduler l, thread_pool_scheduler r) noexcept {
        return l.impl_ != r.impl_;
    }

private:
    //! The implementation data; parent object must be active for the lifetime of this object
    pool_data* impl_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief   A pool of threads that can execute scheduled tasks. A *shared* scheduler backend.
 *
 * This is constructed with the number of worker threads that are needed in the pool. There is no
 * automatic resizing of the pool. Ready tasks are executed in FIFO order, by any of the workers.
 * Delayed tasks are kept by a dedicated timer thread until their deadline is reached.
 *
 * Cancellation profile:
 *  - the abort capability is attached to the subscription before the task is enqueued, so closing
 *    the subscription at any point before the task starts guarantees the task won't run
 *  - aborting a delayed task drops it from the timer right away; it will not hold wait()
 *  - a task body that already started is never interrupted; it runs to completion
 *
 * Exceptions thrown by task bodies are passed to `pool_config::except_fun_`; if this is not set,
 * std::terminate() is called.
 *
 * The user can manually signal the pool to stop processing items, and/or wait for the existing
 * work to drain out. Scheduler objects obtained from the pool cannot exceed its lifetime.
 *
 * @see thread_pool_scheduler, pool_config
 */
class thread_pool {
public:
    //! The type of scheduler that this object exposes
    using scheduler_type = detail::thread_pool_scheduler;

    //! Constructs a pool with the given number of threads
    explicit thread_pool(std::size_t num_threads);
    //! Constructs a pool with the given configuration
    explicit thread_pool(const pool_config& config);

    //! Copy constructor is DISABLED
    thread_pool(const thread_pool&) = delete;
    //! Copy assignment is DISABLED
    thread_pool& operator=(const thread_pool&) = delete;

    thread_pool(thread_pool&&) noexcept;
    thread_pool& operator=(thread_pool&&) noexcept;

    /**
     * \brief   Destructor.
     *
     * Stops the pool, dropping all the tasks that didn't start yet, and waits for the in-progress
     * tasks to complete.
     */
    ~thread_pool();

    /**
     * \brief   Signal the pool to stop taking work.
     *
     * After calling this, no new work is accepted; spawning will throw submission_error. The tasks
     * that didn't start yet (including delayed ones) are dropped, and their subscriptions are closed.
     * Tasks already running are not affected. This returns immediately, without waiting for the
     * running tasks.
     */
    void stop();

    /**
     * \brief   Wait for all the work accepted by the pool to complete.
     *
     * Blocks until all the tasks accepted by the pool (including the delayed ones) are executed or
     * skipped because they were cancelled. After this, the pool is stopped; no new work will be
     * accepted.
     *
     * Must not be called from within a task running in this pool; throws std::logic_error in this
     * case.
     */
    void wait();

    //! Returns a scheduler that can be used to schedule work on this pool
    scheduler_type scheduler() noexcept;

    //! The number of worker threads in the pool
    std::size_t num_workers() const noexcept;

private:
    //! The implementation data; use pimpl idiom
    std::unique_ptr<detail::pool_data> impl_;
};

} // namespace v1

} // namespace rxsched
