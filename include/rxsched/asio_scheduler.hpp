/**
 * @file    asio_scheduler.hpp
 * @brief   Definition of @ref rxsched::v1::asio_scheduler "asio_scheduler"
 */
#pragma once

#include "deferred_task.hpp"
#include "except_fun_type.hpp"
#include "subscription.hpp"

#include <boost/asio/io_context.hpp>

namespace rxsched {

inline namespace v1 {

/**
 * @brief   Scheduler that runs tasks on a Boost.Asio `io_context`. A *shared* scheduler.
 *
 * The io_context is the managed runtime; it is always passed explicitly and must outlive the
 * scheduler and all the work spawned through it. The tasks are executed by whatever threads run
 * the io_context; this can be one thread or many, so the scheduler is a shared one.
 *
 * Delayed tasks are implemented with `boost::asio::steady_timer`.
 *
 * Cancellation profile:
 *  - the abort capability is attached to the subscription before the work is posted, so closing
 *    the subscription before the task starts guarantees the task won't run
 *  - the delay wait is a suspension point of the runtime: aborting cancels the timer, and the
 *    work completes right away, without waiting for the deadline
 *  - a task body that already started is never interrupted; it runs to completion
 *  - the io_context can be stopped by another thread between the check made by spawn() and the
 *    moment the work is posted. Such work is accepted, but it runs only if the io_context is
 *    restarted and run again; if the io_context is destroyed instead, the work is dropped and its
 *    subscription is closed.
 *
 * The spawned work counts as outstanding work of the io_context, so `io_context::run()` returns
 * only after all the tasks are executed or cancelled; this is how callers wait for the tasks.
 *
 * Exceptions thrown by task bodies are passed to the given exception handler; if there is none,
 * they propagate out of `io_context::run()`, as for any Asio handler.
 *
 * Spawning throws submission_error if the io_context is stopped.
 */
class asio_scheduler {
public:
    using subscription_type = shared_subscription;

    explicit asio_scheduler(boost::asio::io_context& ctx, except_fun_t except_fun = {});

    //! Submits the deferred task to the io_context
    void spawn(deferred_task t, shared_subscription& sub) const;

    //! Checks if the current thread is running the io_context
    bool running_in_this_thread() const noexcept;

    //! The io_context used by this scheduler
    boost::asio::io_context& context() const noexcept { return *ctx_; }

    friend bool operator==(const asio_scheduler& l, const asio_scheduler& r) noexcept {
        return l.ctx_ == r.ctx_;
    }
    friend bool operator!=(const asio_scheduler& l, const asio_scheduler& r) noexcept {
        return l.ctx_ != r.ctx_;
    }

private:
    boost::asio::io_context* ctx_;
    except_fun_t except_fun_;
};

} // namespace v1

} // namespace rxsched
