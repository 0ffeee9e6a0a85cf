#pragma once

#include <functional>
#include <memory>

namespace rxsched {

namespace detail {
struct abort_state;
}

inline namespace v1 {

class abort_registration;

/**
 * @brief      The capability to abort one unit of work submitted to a backend.
 *
 * An abort handle is created by a backend adapter for each unit of work it accepts. The handle is
 * handed over to the leaf subscription of the work; its counterpart, the @ref abort_registration,
 * travels together with the work inside the backend.
 *
 * Calling abort() guarantees that the work will not start if it didn't already start. If the
 * backend installed an interrupt hook on the registration (see @ref abort_registration::on_abort()),
 * abort() will also call that hook, so that the backend can stop a pending wait (e.g., a timer)
 * earlier. Once the work has started, abort() has no effect on it.
 *
 * The handle has move-only semantics: there is exactly one owner of the capability.
 *
 * @see abort_registration
 */
class abort_handle {
public:
    //! Creates an empty handle; abort() will do nothing on it
    abort_handle() noexcept = default;
    ~abort_handle() = default;

    abort_handle(abort_handle&&) noexcept = default;
    abort_handle& operator=(abort_handle&&) noexcept = default;

    //! Copy constructor is DISABLED
    abort_handle(const abort_handle&) = delete;
    //! Copy assignment is DISABLED
    abort_handle& operator=(const abort_handle&) = delete;

    //! Creates a new abort handle, for a new unit of work
    static abort_handle create();

    //! Returns the registration object to be passed to the backend, together with the work
    abort_registration registration() const;

    //! Requests the abort of the associated work. Can be called multiple times, from any thread.
    void abort() noexcept;

    //! Checks whether abort() was called on this handle
    bool is_aborted() const noexcept;

    //! Checks if this is a valid handle
    explicit operator bool() const noexcept { return static_cast<bool>(impl_); }

private:
    std::shared_ptr<detail::abort_state> impl_;
};

/**
 * @brief      The backend side of an @ref abort_handle.
 *
 * This is carried by the work submitted to a backend. Just before running the work, the backend
 * calls try_start(); if this returns false, the work was aborted and must be skipped.
 *
 * Backends that can interrupt a pending wait (a delay timer, a timer queue entry) install a hook
 * with on_abort(). The hook is called at most once, from the thread calling
 * abort_handle::abort(). It is never called after try_start() succeeded.
 */
class abort_registration {
public:
    abort_registration() noexcept = default;

    //! Checks whether the associated handle was aborted
    bool is_aborted() const noexcept;

    //! Installs the interrupt hook; if the work was already aborted, the hook is called immediately
    void on_abort(std::function<void()> hook);

    //! Marks the beginning of the work. Returns false if the work was aborted and must be skipped.
    bool try_start() noexcept;

    //! Called when the backend drops the work without running it; the hook is not called anymore
    void discard() noexcept;

    //! Checks if this is a valid registration
    explicit operator bool() const noexcept { return static_cast<bool>(impl_); }

private:
    explicit abort_registration(std::shared_ptr<detail::abort_state> impl) noexcept
        : impl_(std::move(impl)) {}

    std::shared_ptr<detail::abort_state> impl_;

    friend abort_handle;
};

} // namespace v1

} // namespace rxsched
