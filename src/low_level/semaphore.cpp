#include "rxsched/low_level/semaphore.hpp"
#include "rxsched/profiling.hpp"

#include <cassert>
#include <cerrno>
#include <system_error>

#if RXSCHED_PLATFORM_LINUX
#include <semaphore.h>
#endif

namespace rxsched {
inline namespace v1 {

#if RXSCHED_PLATFORM_LINUX

namespace {
sem_t* as_sem(std::aligned_storage<32>::type& storage) {
    return reinterpret_cast<sem_t*>(&storage); // NOLINT
}
} // namespace

semaphore::semaphore(int start_count) {
    static_assert(sizeof(sem_t) <= sizeof(sem_), "Did not find the right size of sem_t");
    if (sem_init(as_sem(sem_), 0, static_cast<unsigned>(start_count)) != 0)
        throw std::system_error(errno, std::generic_category(), "sem_init");
}

semaphore::~semaphore() {
    int ret = sem_destroy(as_sem(sem_));
    assert(ret == 0);
    static_cast<void>(ret);
}

void semaphore::wait() {
    RXSCHED_PROFILING_SCOPE_C(RXSCHED_PROFILING_COLOR_SILVER);
    while (sem_wait(as_sem(sem_)) != 0)
        ; // interrupted by a signal; try again
}

void semaphore::signal() { sem_post(as_sem(sem_)); }

#else

semaphore::semaphore(int start_count)
    : count_(start_count) {}

semaphore::~semaphore() = default;

void semaphore::wait() {
    RXSCHED_PROFILING_SCOPE_C(RXSCHED_PROFILING_COLOR_SILVER);
    std::unique_lock<std::mutex> lock{mutex_};
    cond_var_.wait(lock, [this] { return count_ > 0; });
    count_--;
}

void semaphore::signal() {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        count_++;
    }
    cond_var_.notify_one();
}

#endif

void semaphore::signal(int n) {
    while (n-- > 0)
        signal();
}

} // namespace v1
} // namespace rxsched
