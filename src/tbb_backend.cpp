#include "rxsched/tbb_backend.hpp"

#if RXSCHED_USE_TBB

#include "rxsched/detail/spawn_helpers.hpp"
#include "rxsched/detail/timer_thread.hpp"
#include "rxsched/profiling.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace rxsched {
namespace detail {

struct tbb_data : std::enable_shared_from_this<tbb_data> {
    tbb::task_arena* arena_;
    except_fun_t except_fun_;
    //! Set when no new work is accepted; work that didn't start is skipped
    std::atomic<bool> stopped_{false};
    //! Protects the number of outstanding tasks
    std::mutex bottleneck_;
    std::condition_variable drained_;
    std::size_t num_outstanding_{0};
    std::unique_ptr<timer_thread> timers_;

    tbb_data(tbb::task_arena& arena, except_fun_t except_fun)
        : arena_(&arena)
        , except_fun_(std::move(except_fun)) {}

    void start_timers() {
        std::weak_ptr<tbb_data> self = shared_from_this();
        timers_ = std::make_unique<timer_thread>(
                [self](task_function&& t) {
                    if (auto data = self.lock())
                        data->enqueue(std::move(t));
                },
                [self](std::size_t count) {
                    if (auto data = self.lock())
                        data->finish_tasks(count);
                });
    }

    void enqueue(task_function&& t) {
        RXSCHED_PROFILING_SCOPE_N("enqueue");
        // The arena keeps the functor as const; the work is released through the pointer
        auto self = shared_from_this();
        auto work = std::make_shared<task_function>(std::move(t));
        arena_->enqueue([self, work] { self->execute(*work); });
    }

    void execute(task_function& f) noexcept {
        RXSCHED_PROFILING_SCOPE_N("TBB execute");
        if (!stopped_.load(std::memory_order_acquire))
            run_work(f, except_fun_);
        f = nullptr;
        finish_tasks(1);
    }

    void finish_tasks(std::size_t count) {
        std::lock_guard<std::mutex> lock{bottleneck_};
        num_outstanding_ -= count;
        if (num_outstanding_ == 0)
            drained_.notify_all();
    }

    void wait_drained() {
        std::unique_lock<std::mutex> lock{bottleneck_};
        drained_.wait(lock, [this] { return num_outstanding_ == 0; });
    }

    void stop() {
        stopped_.store(true, std::memory_order_release);
        timers_->stop();
    }
};

void tbb_spawn(const std::shared_ptr<tbb_data>& data, deferred_task&& t, shared_subscription& sub) {
    RXSCHED_PROFILING_FUNCTION();
    if (data->stopped_.load(std::memory_order_acquire))
        reject_work(sub, submission_failure::stopped);

    const bool delayed = t.has_delay();
    const auto deadline = delayed ? timer_thread::clock::now() + *t.delay()
                                  : timer_thread::clock::time_point{};
    auto reg = attach_abort_handle(sub);
    auto work = make_abortable(std::move(t), reg, sub);
    {
        std::lock_guard<std::mutex> lock{data->bottleneck_};
        data->num_outstanding_++;
    }
    if (!delayed) {
        data->enqueue(std::move(work));
    } else if (!data->timers_->add(deadline, std::move(work), reg)) {
        data->finish_tasks(1);
        reject_work(sub, submission_failure::stopped);
    }
}

} // namespace detail

inline namespace v1 {

tbb_backend::tbb_backend(tbb::task_arena& arena, except_fun_t except_fun)
    : data_(std::make_shared<detail::tbb_data>(arena, std::move(except_fun))) {
    data_->start_timers();
}

tbb_backend::~tbb_backend() {
    data_->stop();
    data_->wait_drained();
}

void tbb_backend::stop() { data_->stop(); }

void tbb_backend::wait() {
    // Delayed tasks are counted as outstanding from the moment they are accepted
    data_->wait_drained();
    data_->stop();
}

} // namespace v1

} // namespace rxsched

#endif
