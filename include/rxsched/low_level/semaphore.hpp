#pragma once

#include "../detail/platform.hpp"

#include <type_traits>

#if !RXSCHED_PLATFORM_LINUX
#include <condition_variable>
#include <mutex>
#endif

namespace rxsched {

inline namespace v1 {

/**
 * @brief      The classic "semaphore" synchronization primitive.
 *
 * It atomically maintains an internal count. The count can always be increased by calling signal(),
 * which is always a non-blocking call. When calling wait(), the count is decremented; if the count
 * is still positive the call will be non-blocking; if the count goes below zero, the call to wait()
 * will block until some other thread calls signal().
 *
 * Used to park the worker threads of a pool while there is no work for them.
 */
class semaphore {
public:
    /**
     * @brief      Constructs a new semaphore instance
     *
     * @param      start_count  The value that the semaphore count should have at start
     */
    explicit semaphore(int start_count = 0);
    //! Destructor
    ~semaphore();

    //! Copy constructor is DISABLED
    semaphore(const semaphore&) = delete;
    //! Copy assignment is DISABLED
    void operator=(const semaphore&) = delete;

    //! Decrement the internal count, waiting for the count to be positive first.
    void wait();

    //! Increment the internal count, waking up one waiting thread (if any)
    void signal();

    //! Increment the internal count `n` times
    void signal(int n);

private:
#if RXSCHED_PLATFORM_LINUX
    //! Storage for a sem_t
    std::aligned_storage<32>::type sem_;
#else
    std::condition_variable cond_var_;
    std::mutex mutex_;
    int count_;
#endif
};

} // namespace v1
} // namespace rxsched
