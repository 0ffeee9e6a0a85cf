/**
 * @file    any_scheduler.hpp
 * @brief   Defines the @ref rxsched::v1::any_scheduler "any_scheduler" class
 */
#pragma once

#include "deferred_task.hpp"
#include "scheduler.hpp"
#include "subscription.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <typeinfo>
#include <utility>

namespace rxsched {

namespace detail {
template <typename Subscription>
struct scheduler_base {
    scheduler_base() = default;
    virtual ~scheduler_base() = default;

    scheduler_base(const scheduler_base&) = delete;
    scheduler_base(scheduler_base&&) = delete;
    scheduler_base& operator=(const scheduler_base&) = delete;
    scheduler_base& operator=(scheduler_base&&) = delete;

    virtual void spawn(deferred_task t, Subscription& sub) const = 0;
    virtual std::unique_ptr<scheduler_base> clone() const = 0;
    virtual bool is_same(const scheduler_base& other) const = 0;
    virtual const std::type_info& target_type() const noexcept = 0;
    virtual const void* target() const noexcept = 0;
};

template <typename Scheduler, typename Subscription>
struct scheduler_wrapper : scheduler_base<Subscription> {
    explicit scheduler_wrapper(Scheduler s)
        : sched_(std::move(s)) {}

    void spawn(deferred_task t, Subscription& sub) const override {
        sched_.spawn(std::move(t), sub);
    }
    std::unique_ptr<scheduler_base<Subscription>> clone() const override {
        return std::make_unique<scheduler_wrapper>(sched_);
    }
    bool is_same(const scheduler_base<Subscription>& other) const override {
        return sched_ == static_cast<const scheduler_wrapper&>(other).sched_;
    }
    const std::type_info& target_type() const noexcept override { return typeid(Scheduler); }
    const void* target() const noexcept override { return &sched_; }

    //! The actual scheduler instance
    Scheduler sched_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief A polymorphic scheduler wrapper
 *
 * @tparam Subscription The subscription type of the wrapped schedulers; this selects between the
 *                      shared and the local scheduler variants
 *
 * This provides a type erasure on a scheduler type. The concrete scheduler is chosen when the
 * object is constructed; after that, it can be used as any other scheduler of the same variant:
 * with `spawn()` or with the `schedule()` function.
 *
 * The wrapped scheduler must be copyable and equality comparable.
 *
 * Calling spawn() on an empty wrapper throws std::logic_error.
 *
 * @see any_shared_scheduler, any_local_scheduler
 */
template <typename Subscription>
class any_scheduler {
public:
    using subscription_type = Subscription;

    //! Constructs an empty wrapper
    any_scheduler() noexcept = default;
    //! Constructs an empty wrapper
    explicit any_scheduler(std::nullptr_t) noexcept {}

    //! Constructor from a scheduler of the same variant
    template <typename Scheduler,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<Scheduler>, any_scheduler>>>
    // cppcheck-suppress noExplicitConstructor
    any_scheduler(Scheduler s)
        : wrapper_(std::make_unique<detail::scheduler_wrapper<Scheduler, Subscription>>(
                  std::move(s))) {
        static_assert(detail::is_scheduler_for<Scheduler, Subscription>::value,
                "Type needs to be a scheduler with the same subscription type");
    }

    any_scheduler(const any_scheduler& other)
        : wrapper_(other.wrapper_ ? other.wrapper_->clone() : nullptr) {}
    any_scheduler(any_scheduler&& other) noexcept = default;

    any_scheduler& operator=(const any_scheduler& other) {
        any_scheduler(other).swap(*this);
        return *this;
    }
    any_scheduler& operator=(any_scheduler&& other) noexcept = default;

    ~any_scheduler() = default;

    //! Swaps the content of this object with the content of the given object
    void swap(any_scheduler& other) noexcept { wrapper_.swap(other.wrapper_); }

    //! Forwards the deferred task to the wrapped scheduler
    void spawn(deferred_task t, Subscription& sub) const {
        if (!wrapper_)
            throw std::logic_error("spawn called on an empty any_scheduler");
        wrapper_->spawn(std::move(t), sub);
    }

    //! Checks if this object is wrapping a scheduler
    explicit operator bool() const noexcept { return wrapper_ != nullptr; }

    //! Returns the type_info for the wrapped scheduler type
    const std::type_info& target_type() const noexcept {
        return wrapper_ ? wrapper_->target_type() : typeid(std::nullptr_t);
    }

    //! Helper method to get the underlying scheduler, if its type is specified
    template <typename Scheduler>
    const Scheduler* target() const noexcept {
        return wrapper_ && wrapper_->target_type() == typeid(Scheduler)
                       ? static_cast<const Scheduler*>(wrapper_->target())
                       : nullptr;
    }

    friend inline bool operator==(const any_scheduler& l, const any_scheduler& r) {
        if (!l && !r)
            return true;
        else if (l && r && l.target_type() == r.target_type())
            return l.wrapper_->is_same(*r.wrapper_);
        else
            return false;
    }
    friend inline bool operator!=(const any_scheduler& l, const any_scheduler& r) {
        return !(l == r);
    }

private:
    std::unique_ptr<detail::scheduler_base<Subscription>> wrapper_;
};

//! Type-erased shared scheduler
using any_shared_scheduler = any_scheduler<shared_subscription>;
//! Type-erased local scheduler
using any_local_scheduler = any_scheduler<local_subscription>;

} // namespace v1

} // namespace rxsched
