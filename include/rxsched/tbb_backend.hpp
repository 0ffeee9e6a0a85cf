/**
 * @file    tbb_backend.hpp
 * @brief   Definition of @ref rxsched::v1::tbb_backend "tbb_backend"
 */
#pragma once

#if RXSCHED_USE_TBB || DOXYGEN_BUILD

#include "deferred_task.hpp"
#include "except_fun_type.hpp"
#include "subscription.hpp"

#include <tbb/task_arena.h>

#include <memory>

namespace rxsched {

namespace detail {

struct tbb_data;

//! Submits work to the TBB arena; throws submission_error if the backend doesn't accept it
void tbb_spawn(const std::shared_ptr<tbb_data>& data, deferred_task&& t, shared_subscription& sub);

//! The scheduler type exposed by the TBB backend
class tbb_scheduler {
public:
    using subscription_type = shared_subscription;

    explicit tbb_scheduler(std::shared_ptr<tbb_data> data) noexcept
        : data_(std::move(data)) {}

    //! Submits the deferred task to the arena of the backend
    void spawn(deferred_task t, shared_subscription& sub) const {
        tbb_spawn(data_, std::move(t), sub);
    }

    friend bool operator==(const tbb_scheduler& l, const tbb_scheduler& r) noexcept {
        return l.data_ == r.data_;
    }
    friend bool operator!=(const tbb_scheduler& l, const tbb_scheduler& r) noexcept {
        return l.data_ != r.data_;
    }

private:
    std::shared_ptr<tbb_data> data_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief   Backend that sends tasks to a TBB task arena. Provides a *shared* scheduler.
 *
 * The arena is passed explicitly, and must outlive this object. The tasks are enqueued in the
 * arena (fire-and-forget), and executed by the TBB worker threads. Delayed tasks are kept by a
 * dedicated timer thread until their deadline is reached, and only then enqueued.
 *
 * Cancellation profile:
 *  - the abort capability is attached to the subscription before the task is enqueued, so closing
 *    the subscription before the task starts guarantees the task won't run
 *  - aborting a delayed task drops it from the timer right away
 *  - a task body that already started is never interrupted; it runs to completion
 *
 * Exceptions thrown by task bodies are passed to the given exception handler; if there is none,
 * std::terminate() is called.
 */
class tbb_backend {
public:
    //! The type of scheduler that this object exposes
    using scheduler_type = detail::tbb_scheduler;

    explicit tbb_backend(tbb::task_arena& arena, except_fun_t except_fun = {});

    //! Stops the backend and waits for the tasks that already started
    ~tbb_backend();

    tbb_backend(const tbb_backend&) = delete;
    tbb_backend& operator=(const tbb_backend&) = delete;

    //! Stops accepting new work; tasks that didn't start yet are dropped and their subscriptions
    //! closed
    void stop();

    //! Waits for all the accepted work to complete (including the delayed one), then stops
    void wait();

    //! Returns a scheduler that can be used to schedule work on this backend
    scheduler_type scheduler() const noexcept { return scheduler_type{data_}; }

private:
    std::shared_ptr<detail::tbb_data> data_;
};

} // namespace v1

} // namespace rxsched

#endif
