#pragma once

#include <condition_variable>
#include <mutex>
#include <chrono>

using namespace std::chrono_literals;

//! Structure used to wait for a known number of scheduled tasks to be completed.
//!
//! Each task calls `task_finished` when done; the main thread calls `wait_for_all`, which returns
//! true if all the tasks completed before the timeout.
struct task_countdown {
    explicit task_countdown(int num_tasks)
        : tasks_remaining_(num_tasks) {}

    //! Called by every task to announce that the task is completed
    void task_finished() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_remaining_--;
        }
        cond_.notify_all();
    }

    //! Returns true if all tasks were completed, or false, if there is a timeout.
    bool wait_for_all(std::chrono::milliseconds timeout = 1000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, timeout, [this]() { return tasks_remaining_ <= 0; });
    }

private:
    int tasks_remaining_;
    std::condition_variable cond_;
    std::mutex mutex_;
};
