#include "rxsched/thread_pool.hpp"
#include "rxsched/low_level/semaphore.hpp"
#include "rxsched/detail/spawn_helpers.hpp"
#include "rxsched/detail/timer_thread.hpp"
#include "rxsched/profiling.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rxsched {
namespace detail {

//! The pool whose worker is the current thread; null for non-worker threads
thread_local const pool_data* g_current_pool{nullptr};

struct pool_data {
    //! The configuration used to create the pool
    pool_config config_;
    //! Protects all the fields below, except the threads
    std::mutex bottleneck_;
    //! The tasks ready to be executed
    std::deque<task_function> ready_tasks_;
    //! Number of tasks accepted, but not started (ready or waiting for their deadline)
    std::size_t num_not_started_{0};
    //! Number of tasks accepted and not yet completed
    std::size_t num_outstanding_{0};
    //! Set when the pool doesn't accept new tasks anymore
    bool stopped_{false};
    //! Set when the workers need to exit
    bool shutting_down_{false};
    //! Notified whenever there are no outstanding tasks
    std::condition_variable drained_;
    //! Signaled once for each task made ready, and once for each worker at shutdown
    semaphore has_work_;
    //! The worker threads
    std::vector<std::thread> workers_;
    //! Holds the delayed tasks until their deadline
    std::unique_ptr<timer_thread> timers_;

    explicit pool_data(const pool_config& config);
    ~pool_data();

    pool_data(const pool_data&) = delete;
    pool_data& operator=(const pool_data&) = delete;

    void stop();
    void worker_run();
    //! Called by the timer thread when a delayed task is due
    void on_task_due(task_function&& t);
    //! Called when accepted tasks were dropped before starting
    void on_tasks_dropped(std::size_t count);
    //! Execute a task; exceptions not handled by the except function terminate the program
    void execute(task_function& t) noexcept;
    //! Decrements the outstanding count; must be called with the lock held
    void finish_tasks(std::size_t count);
};

namespace {
std::size_t worker_count(const pool_config& config) {
    if (config.num_workers_ > 0)
        return static_cast<std::size_t>(config.num_workers_);
    auto n = std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
}
} // namespace

pool_data::pool_data(const pool_config& config)
    : config_(config) {
    RXSCHED_PROFILING_INIT();
    RXSCHED_PROFILING_FUNCTION();
    timers_ = std::make_unique<timer_thread>([this](task_function&& t) { on_task_due(std::move(t)); },
            [this](std::size_t count) { on_tasks_dropped(count); });
    auto count = worker_count(config_);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; i++)
        workers_.emplace_back([this] { worker_run(); });
}

pool_data::~pool_data() {
    RXSCHED_PROFILING_FUNCTION();
    stop();
    {
        std::lock_guard<std::mutex> lock{bottleneck_};
        shutting_down_ = true;
    }
    has_work_.signal(static_cast<int>(workers_.size()));
    for (auto& w : workers_)
        w.join();
}

void pool_data::stop() {
    RXSCHED_PROFILING_FUNCTION();
    std::deque<task_function> dropped;
    {
        std::lock_guard<std::mutex> lock{bottleneck_};
        stopped_ = true;
        dropped.swap(ready_tasks_);
        num_not_started_ -= dropped.size();
        finish_tasks(dropped.size());
    }
    // Drops the delayed tasks; they are reported through on_tasks_dropped()
    timers_->stop();
}

void pool_data::worker_run() {
    RXSCHED_PROFILING_SETTHREADNAME("rxsched_worker");
    RXSCHED_PROFILING_MESSAGE("worker started");
    g_current_pool = this;
    if (config_.worker_start_fun_)
        config_.worker_start_fun_();

    while (true) {
        has_work_.wait();
        task_function t;
        {
            std::lock_guard<std::mutex> lock{bottleneck_};
            if (shutting_down_)
                break;
            if (ready_tasks_.empty())
                continue; // the task was dropped by stop()
            t = std::move(ready_tasks_.front());
            ready_tasks_.pop_front();
            num_not_started_--;
        }
        execute(t);
        t = nullptr;
        std::lock_guard<std::mutex> lock{bottleneck_};
        finish_tasks(1);
    }
    g_current_pool = nullptr;
}

void pool_data::on_task_due(task_function&& t) {
    {
        std::lock_guard<std::mutex> lock{bottleneck_};
        if (stopped_) {
            num_not_started_--;
            finish_tasks(1);
            return;
        }
        ready_tasks_.emplace_back(std::move(t));
    }
    has_work_.signal();
}

void pool_data::on_tasks_dropped(std::size_t count) {
    RXSCHED_PROFILING_MESSAGE("delayed tasks dropped");
    std::lock_guard<std::mutex> lock{bottleneck_};
    num_not_started_ -= count;
    finish_tasks(count);
}

void pool_data::execute(task_function& t) noexcept {
    RXSCHED_PROFILING_FUNCTION();
    run_work(t, config_.except_fun_);
}

void pool_data::finish_tasks(std::size_t count) {
    num_outstanding_ -= count;
    if (num_outstanding_ == 0)
        drained_.notify_all();
}

void pool_spawn(pool_data& pool, deferred_task&& t, shared_subscription& sub) {
    RXSCHED_PROFILING_FUNCTION();
    const bool delayed = t.has_delay();
    const auto deadline = delayed ? timer_thread::clock::now() + *t.delay()
                                  : timer_thread::clock::time_point{};

    abort_registration reg;
    task_function work;
    {
        std::unique_lock<std::mutex> lock{pool.bottleneck_};
        if (pool.stopped_ || (pool.config_.max_pending_ > 0 &&
                                     pool.num_not_started_ >= pool.config_.max_pending_)) {
            auto reason = pool.stopped_ ? submission_failure::stopped : submission_failure::saturated;
            lock.unlock();
            reject_work(sub, reason);
        }
        // Register the abort capability before the task can be picked up by a worker
        reg = attach_abort_handle(sub);
        work = make_abortable(std::move(t), reg, sub);
        pool.num_not_started_++;
        pool.num_outstanding_++;
        if (!delayed)
            pool.ready_tasks_.emplace_back(std::move(work));
    }

    if (!delayed) {
        pool.has_work_.signal();
    } else if (!pool.timers_->add(deadline, std::move(work), reg)) {
        // The pool was stopped in the meantime; the task will not be executed
        pool.on_tasks_dropped(1);
        reject_work(sub, submission_failure::stopped);
    }
}

bool pool_owns_current_thread(const pool_data& pool) noexcept { return g_current_pool == &pool; }

} // namespace detail

inline namespace v1 {

thread_pool::thread_pool(std::size_t num_threads)
    : thread_pool([num_threads] {
        pool_config config;
        config.num_workers_ = static_cast<int>(num_threads);
        return config;
    }()) {}

thread_pool::thread_pool(const pool_config& config)
    : impl_(std::make_unique<detail::pool_data>(config)) {}

thread_pool::thread_pool(thread_pool&&) noexcept = default;
thread_pool& thread_pool::operator=(thread_pool&&) noexcept = default;

thread_pool::~thread_pool() = default;

void thread_pool::stop() { impl_->stop(); }

void thread_pool::wait() {
    if (detail::pool_owns_current_thread(*impl_))
        throw std::logic_error("cannot wait on a thread_pool from one of its tasks");
    {
        std::unique_lock<std::mutex> lock{impl_->bottleneck_};
        impl_->drained_.wait(lock, [this] { return impl_->num_outstanding_ == 0; });
    }
    // Ensure that no more tasks are added to the pool
    impl_->stop();
}

thread_pool::scheduler_type thread_pool::scheduler() noexcept {
    return detail::thread_pool_scheduler{impl_.get()};
}

std::size_t thread_pool::num_workers() const noexcept { return impl_->workers_.size(); }

} // namespace v1

} // namespace rxsched
