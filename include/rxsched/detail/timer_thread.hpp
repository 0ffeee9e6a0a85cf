#pragma once

#include "timer_queue.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace rxsched {
namespace detail {

/**
 * @brief      A thread that releases delayed work when its deadline is reached.
 *
 * When the deadline of a work item is reached, the work is passed to the `due` function (called on
 * the timer thread); it's the job of the owner to actually execute it. Work that is aborted before
 * its deadline is dropped as soon as possible, and the `dropped` function is called with the
 * number of dropped items. Stopping the timer thread drops all the pending work.
 *
 * Used by the backends that have no timers of their own.
 */
class timer_thread {
public:
    using clock = timer_queue::clock;
    //! Called on the timer thread with the work that is due
    using due_fun = std::function<void(task_function&&)>;
    //! Called with the number of work items that were dropped
    using dropped_fun = std::function<void(std::size_t)>;

    timer_thread(due_fun on_due, dropped_fun on_dropped);
    ~timer_thread();

    timer_thread(const timer_thread&) = delete;
    timer_thread& operator=(const timer_thread&) = delete;

    //! Adds work to be released at the given deadline.
    //! Returns false (and drops nothing) if the timer thread is stopped.
    bool add(clock::time_point deadline, task_function work, const abort_registration& reg);

    //! Stops the thread, dropping all the pending work. Can be called multiple times.
    void stop();

private:
    struct state {
        std::mutex bottleneck_;
        std::condition_variable wakeup_;
        timer_queue queue_;
        bool done_{false};
        bool has_aborted_{false};
    };

    due_fun on_due_;
    dropped_fun on_dropped_;
    std::shared_ptr<state> state_;
    std::thread thread_;

    void run();
};

} // namespace detail
} // namespace rxsched
