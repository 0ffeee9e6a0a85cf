#include "rxsched/abort_handle.hpp"

#include <atomic>
#include <mutex>

namespace rxsched {

namespace detail {

//! The data shared between an abort_handle and its registration.
struct abort_state {
    //! Set once abort() is called
    std::atomic<bool> aborted_{false};
    //! Set once the work started to execute; after this, the hook is not called anymore
    bool started_{false};
    //! Protects the fields below
    std::mutex bottleneck_;
    //! The interrupt hook installed by the backend
    std::function<void()> hook_;
};

} // namespace detail

inline namespace v1 {

abort_handle abort_handle::create() {
    abort_handle res;
    res.impl_ = std::make_shared<detail::abort_state>();
    return res;
}

abort_registration abort_handle::registration() const { return abort_registration{impl_}; }

void abort_handle::abort() noexcept {
    if (!impl_ || impl_->aborted_.exchange(true, std::memory_order_acq_rel))
        return;

    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock{impl_->bottleneck_};
        if (!impl_->started_)
            hook.swap(impl_->hook_);
    }
    if (hook)
        hook();
}

bool abort_handle::is_aborted() const noexcept {
    return impl_ && impl_->aborted_.load(std::memory_order_acquire);
}

bool abort_registration::is_aborted() const noexcept {
    return impl_ && impl_->aborted_.load(std::memory_order_acquire);
}

void abort_registration::on_abort(std::function<void()> hook) {
    if (!impl_)
        return;
    {
        std::lock_guard<std::mutex> lock{impl_->bottleneck_};
        if (impl_->started_)
            return;
        if (!impl_->aborted_.load(std::memory_order_acquire)) {
            impl_->hook_ = std::move(hook);
            return;
        }
    }
    // Already aborted; nobody else will call the hook
    hook();
}

bool abort_registration::try_start() noexcept {
    if (!impl_)
        return true;
    std::function<void()> old_hook;
    {
        std::lock_guard<std::mutex> lock{impl_->bottleneck_};
        if (impl_->aborted_.load(std::memory_order_acquire))
            return false;
        impl_->started_ = true;
        old_hook.swap(impl_->hook_);
    }
    // old_hook is destroyed outside the lock
    return true;
}

void abort_registration::discard() noexcept {
    if (!impl_)
        return;
    std::function<void()> old_hook;
    std::lock_guard<std::mutex> lock{impl_->bottleneck_};
    impl_->started_ = true;
    old_hook.swap(impl_->hook_);
}

} // namespace v1

} // namespace rxsched
