#pragma once

#include "../abort_handle.hpp"
#include "../deferred_task.hpp"
#include "../except_fun_type.hpp"
#include "../profiling.hpp"
#include "../submission_error.hpp"

#include <memory>
#include <utility>

namespace rxsched {
namespace detail {

//! Creates the abort capability for a new unit of work and attaches it to the subscription.
//! Returns the registration that needs to travel with the work.
template <typename Subscription>
abort_registration attach_abort_handle(Subscription& sub) {
    auto handle = abort_handle::create();
    auto reg = handle.registration();
    sub.attach(std::move(handle));
    return reg;
}

//! Closes the subscription if the work is discarded by the backend without being invoked.
//! Shared by all the copies of the wrapped work; the last copy decides.
template <typename Subscription>
struct drop_guard {
    Subscription sub_;
    abort_registration reg_;
    bool invoked_{false};

    drop_guard(Subscription sub, abort_registration reg)
        : sub_(std::move(sub))
        , reg_(std::move(reg)) {}
    ~drop_guard() {
        if (!invoked_) {
            RXSCHED_PROFILING_MESSAGE("work dropped before start");
            // Nothing left to interrupt in the backend
            reg_.discard();
            sub_.unsubscribe();
        }
    }

    drop_guard(const drop_guard&) = delete;
    drop_guard& operator=(const drop_guard&) = delete;
};

//! Wraps the deferred task so that it's skipped if aborted before starting. If the backend drops
//! the work without invoking it (e.g., on stop), the subscription is closed.
template <typename Subscription>
task_function make_abortable(deferred_task&& t, abort_registration reg, const Subscription& sub) {
    auto guard = std::make_shared<drop_guard<Subscription>>(sub, reg);
    return [reg = std::move(reg), f = t.release(), guard = std::move(guard)]() mutable {
        guard->invoked_ = true;
        if (!reg.try_start()) {
            RXSCHED_PROFILING_MESSAGE("work skipped; aborted before start");
            return;
        }
        if (f)
            f();
    };
}

//! Closes the subscription and reports the rejection to the caller.
template <typename Subscription>
[[noreturn]] void reject_work(Subscription& sub, submission_failure reason) {
    RXSCHED_PROFILING_MESSAGE("work rejected by the backend");
    sub.unsubscribe();
    throw submission_error(reason);
}

//! Runs the given work. If an exception handler is given, exceptions are passed to it; otherwise
//! they propagate to the caller.
inline void run_work(task_function& f, const except_fun_t& except_fun) {
    if (!except_fun) {
        f();
        return;
    }
    try {
        f();
    } catch (...) {
        except_fun(std::current_exception());
    }
}

} // namespace detail
} // namespace rxsched
