#pragma once

#include "except_fun_type.hpp"

#include <cstddef>
#include <functional>

namespace rxsched {

inline namespace v1 {

/**
 * @brief      Configuration data for a @ref thread_pool
 *
 * Any parameters that are left unfilled will have reasonable defaults.
 */
struct pool_config {
    //! The number of worker threads to create; 0 = number of cores available
    int num_workers_{0};
    //! The maximum number of tasks accepted but not yet started; 0 = no limit.
    //! When the limit is reached, spawning new work fails with submission_failure::saturated.
    std::size_t max_pending_{0};
    //! Function to be called at the start of each worker thread.
    //! Use this if you want to do things like setting thread priority, affinity, etc.
    std::function<void()> worker_start_fun_;
    //! Function called whenever a task body throws; if not set, std::terminate() is called.
    except_fun_t except_fun_;
};

/**
 * @brief      Configuration data for a @ref run_loop
 */
struct loop_config {
    //! The maximum number of tasks accepted but not yet started; 0 = no limit.
    std::size_t max_pending_{0};
    //! Function called whenever a task body throws; if not set, the exception propagates out of
    //! the function that runs the loop.
    except_fun_t except_fun_;
};

} // namespace v1

} // namespace rxsched
