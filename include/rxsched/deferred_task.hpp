#pragma once

#include "profiling.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace rxsched {

inline namespace v1 {

//! The type used to express the minimum delay of a scheduled task
using delay_type = std::chrono::steady_clock::duration;

//! Type of function that can be run by the backends; this represents generic *work*.
using task_function = std::function<void()>;

/**
 * @brief      A unit of work that was not executed yet, together with its minimum delay.
 *
 * This is what the schedulers hand over to the backends. The backends are responsible for waiting
 * the delay (if any), and then calling the function call operator.
 *
 * A deferred task has move-only semantics, and can be executed at most once; calling it a second
 * time does nothing.
 *
 * @see make_deferred()
 */
class deferred_task {
public:
    //! Constructs an empty deferred task; nothing to execute
    deferred_task() = default;

    //! Constructs a deferred task from the function to be executed and the optional delay
    explicit deferred_task(task_function body, std::optional<delay_type> delay = {})
        : body_(std::move(body))
        , delay_(delay) {}

    ~deferred_task() = default;

    deferred_task(deferred_task&&) = default;
    deferred_task& operator=(deferred_task&&) = default;

    //! Copy constructor is DISABLED
    deferred_task(const deferred_task&) = delete;
    //! Copy assignment is DISABLED
    deferred_task& operator=(const deferred_task&) = delete;

    //! The minimum delay to wait before executing the task
    const std::optional<delay_type>& delay() const noexcept { return delay_; }

    //! Checks if the backend needs to wait before executing this task
    bool has_delay() const noexcept { return delay_ && delay_->count() > 0; }

    //! Checks if there is anything left to be executed
    explicit operator bool() const noexcept { return static_cast<bool>(body_); }

    //! Executes the task. The task function is released after the first call.
    void operator()() {
        if (!body_)
            return;
        task_function f;
        f.swap(body_);
        f();
    }

    //! Releases the function to be executed; after this, the object is empty
    task_function release() noexcept {
        task_function f;
        f.swap(body_);
        return f;
    }

private:
    task_function body_;
    std::optional<delay_type> delay_;
};

} // namespace v1

namespace detail {

//! The task body and its state, consumed together by the first execution
template <typename F, typename T>
struct task_payload {
    F fun_;
    T state_;

    task_payload(F&& fun, T&& state)
        : fun_(std::move(fun))
        , state_(std::move(state)) {}
};

} // namespace detail

inline namespace v1 {

/**
 * @brief      Builds a cancellation-aware deferred task, and a new subscription for it.
 *
 * @tparam     Subscription  The type of subscription to be created
 *
 * @param      task   The task body; called as `task(subscription, std::move(state))`
 * @param      state  The state to be given to the task body
 * @param      delay  The minimum delay to wait before running the task
 *
 * @return     The new subscription and the deferred task
 *
 * When executed, the returned deferred task first checks the subscription; if the subscription is
 * closed, the task body is skipped. Otherwise the task body is invoked exactly once, consuming the
 * state. The task body and the state may be move-only types.
 *
 * The returned task still needs to be passed to a scheduler's `spawn()` to get executed.
 */
template <typename Subscription, typename F, typename T>
std::pair<Subscription, deferred_task> make_deferred(
        F&& task, T state, std::optional<delay_type> delay = {}) {
    using fun_type = std::decay_t<F>;
    static_assert(std::is_invocable_v<fun_type&, Subscription, T&&>,
            "task needs to be callable as task(subscription, state)");

    Subscription sub;
    auto payload = std::make_shared<detail::task_payload<fun_type, T>>(
            fun_type(std::forward<F>(task)), std::move(state));
    auto body = [sub, payload = std::move(payload)]() mutable {
        if (!payload)
            return;
        auto p = std::move(payload);
        if (sub.is_closed()) {
            RXSCHED_PROFILING_MESSAGE("task skipped; subscription closed");
            return;
        }
        RXSCHED_PROFILING_SCOPE_N("task body");
        p->fun_(sub, std::move(p->state_));
    };
    return {std::move(sub), deferred_task{std::move(body), delay}};
}

} // namespace v1

} // namespace rxsched
