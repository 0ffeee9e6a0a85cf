#include "rxsched/asio_scheduler.hpp"
#include "rxsched/detail/spawn_helpers.hpp"
#include "rxsched/profiling.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>

namespace rxsched {

inline namespace v1 {

asio_scheduler::asio_scheduler(boost::asio::io_context& ctx, except_fun_t except_fun)
    : ctx_(&ctx)
    , except_fun_(std::move(except_fun)) {}

void asio_scheduler::spawn(deferred_task t, shared_subscription& sub) const {
    RXSCHED_PROFILING_FUNCTION();
    if (ctx_->stopped())
        detail::reject_work(sub, submission_failure::stopped);

    const bool delayed = t.has_delay();
    const auto delay = t.delay().value_or(delay_type{});
    auto reg = detail::attach_abort_handle(sub);
    auto work = [f = detail::make_abortable(std::move(t), reg, sub),
                        except_fun = except_fun_]() mutable {
        detail::run_work(f, except_fun);
    };

    if (!delayed) {
        boost::asio::post(*ctx_, std::move(work));
        return;
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(*ctx_, delay);
    timer->async_wait([timer, work = std::move(work)](const boost::system::error_code& ec) mutable {
        if (ec == boost::asio::error::operation_aborted) {
            RXSCHED_PROFILING_MESSAGE("delayed work cancelled");
            return;
        }
        work();
    });

    // Aborting cancels the timer; the cancellation is done on the io_context
    std::weak_ptr<boost::asio::steady_timer> weak_timer = timer;
    reg.on_abort([weak_timer] {
        if (auto tm = weak_timer.lock())
            boost::asio::post(tm->get_executor(), [tm] { tm->cancel(); });
    });
}

bool asio_scheduler::running_in_this_thread() const noexcept {
    return ctx_->get_executor().running_in_this_thread();
}

} // namespace v1

} // namespace rxsched
