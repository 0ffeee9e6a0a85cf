#pragma once

#include "abort_handle.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace rxsched {

namespace detail {

//! Mutex that does nothing; used for subscriptions that never leave their thread
struct null_mutex {
    void lock() noexcept {}
    void unlock() noexcept {}
};

//! Synchronization policy for subscriptions that can be used from multiple threads
struct shared_sync {
    using flag_type = std::atomic<bool>;
    using mutex_type = std::mutex;

    static bool load(const flag_type& f) noexcept { return f.load(std::memory_order_acquire); }
    static bool exchange(flag_type& f, bool val) noexcept {
        return f.exchange(val, std::memory_order_acq_rel);
    }
};

//! Synchronization policy for subscriptions bound to a single execution context
struct local_sync {
    using flag_type = bool;
    using mutex_type = null_mutex;

    static bool load(const flag_type& f) noexcept { return f; }
    static bool exchange(flag_type& f, bool val) noexcept {
        bool old = f;
        f = val;
        return old;
    }
};

//! The state of a leaf subscription; shared between all the copies of the subscription.
template <typename Sync>
struct leaf_state {
    //! Set when the subscription is closed; never reset
    typename Sync::flag_type closed_{false};
    //! Guards the abort handle
    typename Sync::mutex_type bottleneck_;
    //! The abort capability of the backend work associated with this subscription
    abort_handle handle_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief      A leaf subscription: a cancellation token for one scheduled unit of work.
 *
 * @tparam     Sync  The synchronization policy (see @ref shared_subscription and
 *                   @ref local_subscription)
 *
 * A subscription starts Open. Calling unsubscribe() moves it to Closed; this is a one-way
 * transition, and calling unsubscribe() multiple times is the same as calling it once.
 *
 * Subscription objects are lightweight handles: copying a subscription yields another handle to
 * the same leaf. The scheduled task receives a copy, while the caller keeps another one. The
 * identity() of all the copies is the same, and it can be used by aggregates to add/remove this
 * leaf.
 *
 * The leaf exclusively owns at most one @ref abort_handle, attached by the backend adapter while
 * spawning the work. Closing the subscription aborts that handle. This prevents the work from
 * starting if it didn't start yet; it cannot interrupt a task body that is already running.
 *
 * @see shared_subscription, local_subscription, abort_handle
 */
template <typename Sync>
class basic_subscription {
public:
    //! Creates a new, open, subscription
    basic_subscription()
        : impl_(std::make_shared<detail::leaf_state<Sync>>()) {}

    /**
     * @brief      Closes the subscription and aborts the associated work.
     *
     * If the work didn't start yet, it will never start. If the work is running, it will continue
     * to run to completion; the task body may check is_closed() to stop earlier.
     */
    void unsubscribe() noexcept {
        if (Sync::exchange(impl_->closed_, true))
            return;
        std::lock_guard<typename Sync::mutex_type> lock{impl_->bottleneck_};
        impl_->handle_.abort();
    }

    //! Checks if the subscription is closed
    bool is_closed() const noexcept { return Sync::load(impl_->closed_); }

    //! Returns a stable identity for this leaf; the same for all the copies of the subscription
    const void* identity() const noexcept { return impl_.get(); }

    /**
     * @brief      Attaches the abort capability of the backend work.
     *
     * @param      handle  The abort handle of the work associated with this subscription
     *
     * To be called by the backend adapters during spawn(). If the subscription is already closed,
     * the handle is aborted immediately.
     *
     * Throws std::logic_error if there is already a handle attached to this subscription; a leaf
     * is associated with exactly one unit of work.
     */
    void attach(abort_handle handle) {
        bool closed = false;
        {
            std::lock_guard<typename Sync::mutex_type> lock{impl_->bottleneck_};
            if (impl_->handle_)
                throw std::logic_error("subscription already associated with a unit of work");
            impl_->handle_ = std::move(handle);
            closed = Sync::load(impl_->closed_);
        }
        if (closed) {
            std::lock_guard<typename Sync::mutex_type> lock{impl_->bottleneck_};
            impl_->handle_.abort();
        }
    }

    //! Checks if an abort capability was attached to this subscription
    bool has_work() const {
        std::lock_guard<typename Sync::mutex_type> lock{impl_->bottleneck_};
        return static_cast<bool>(impl_->handle_);
    }

    friend bool operator==(const basic_subscription& l, const basic_subscription& r) noexcept {
        return l.impl_ == r.impl_;
    }
    friend bool operator!=(const basic_subscription& l, const basic_subscription& r) noexcept {
        return l.impl_ != r.impl_;
    }

private:
    std::shared_ptr<detail::leaf_state<Sync>> impl_;
};

/**
 * @brief      Subscription that can be shared between threads.
 *
 * Used by the schedulers that run work on worker threads. The closed flag is atomic and the abort
 * capability is protected by a mutex, so unsubscribe() and is_closed() can be called concurrently
 * from any threads.
 */
using shared_subscription = basic_subscription<detail::shared_sync>;

/**
 * @brief      Subscription bound to a single execution context.
 *
 * Used by schedulers that run all the work on the thread that drives a cooperative loop. There is
 * no synchronization; the subscription must not be used from other threads.
 */
using local_subscription = basic_subscription<detail::local_sync>;

} // namespace v1

} // namespace rxsched
