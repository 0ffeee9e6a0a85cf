#pragma once

#include "deferred_task.hpp"
#include "subscription.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace rxsched {

namespace detail {

template <typename S, typename = void>
struct has_subscription_type : std::false_type {};

template <typename S>
struct has_subscription_type<S, std::void_t<typename S::subscription_type>> : std::true_type {};

template <typename S, typename Subscription, typename = void>
struct is_scheduler_for : std::false_type {};

template <typename S, typename Subscription>
struct is_scheduler_for<S, Subscription,
        std::enable_if_t<has_subscription_type<S>::value &&
                         std::is_same_v<typename S::subscription_type, Subscription>>>
    : std::is_void<decltype(std::declval<const S&>().spawn(
              std::declval<deferred_task>(), std::declval<Subscription&>()))> {};

} // namespace detail

inline namespace v1 {

/**
 * @brief      Checks if the given type is a *shared* scheduler.
 *
 * A shared scheduler exposes:
 *  - `subscription_type`, equal to @ref shared_subscription
 *  - `void spawn(deferred_task t, shared_subscription& sub) const`
 *
 * The work submitted to a shared scheduler may be executed on any thread. The task body, its state
 * and the subscription must be safe to transfer to other threads.
 */
template <typename S>
struct is_shared_scheduler : detail::is_scheduler_for<S, shared_subscription> {};

/**
 * @brief      Checks if the given type is a *local* scheduler.
 *
 * A local scheduler exposes:
 *  - `subscription_type`, equal to @ref local_subscription
 *  - `void spawn(deferred_task t, local_subscription& sub) const`
 *
 * All the work submitted to a local scheduler is executed on the single thread that drives its
 * cooperative loop; the captured state doesn't need to be thread-safe.
 */
template <typename S>
struct is_local_scheduler : detail::is_scheduler_for<S, local_subscription> {};

template <typename S>
inline constexpr bool is_shared_scheduler_v = is_shared_scheduler<S>::value;
template <typename S>
inline constexpr bool is_local_scheduler_v = is_local_scheduler<S>::value;

/**
 * @brief      Schedules a task on the given scheduler.
 *
 * @param      sched  The scheduler to run the task on
 * @param      task   The task body, called as `task(subscription, std::move(state))`
 * @param      delay  Optional minimum delay before running the task
 * @param      state  The state passed to the task body
 *
 * @return     The subscription that can be used to cancel the task
 *
 * This returns immediately, without waiting for the task to be executed. Calling
 * `unsubscribe()` on the returned subscription before the task starts guarantees that the task
 * body is never executed.
 *
 * If the backend cannot accept the task, this throws @ref submission_error.
 */
template <typename Scheduler, typename F, typename T>
typename Scheduler::subscription_type schedule(
        const Scheduler& sched, F&& task, std::optional<delay_type> delay, T state) {
    static_assert(is_shared_scheduler_v<Scheduler> || is_local_scheduler_v<Scheduler>,
            "Type needs to be a shared or a local scheduler");
    using subscription_t = typename Scheduler::subscription_type;
    auto res = make_deferred<subscription_t>(std::forward<F>(task), std::move(state), delay);
    sched.spawn(std::move(res.second), res.first);
    return std::move(res.first);
}

/**
 * @brief      Schedules a task that doesn't need any state.
 *
 * The task body is called as `task(subscription)`.
 *
 * @overload
 */
template <typename Scheduler, typename F>
typename Scheduler::subscription_type schedule(
        const Scheduler& sched, F&& task, std::optional<delay_type> delay = {}) {
    using subscription_t = typename Scheduler::subscription_type;
    struct no_state {};
    return rxsched::schedule(
            sched,
            [f = std::forward<F>(task)](subscription_t sub, no_state) mutable { f(std::move(sub)); },
            delay, no_state{});
}

} // namespace v1

} // namespace rxsched
