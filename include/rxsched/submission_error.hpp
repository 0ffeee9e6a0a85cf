#pragma once

#include <stdexcept>

namespace rxsched {

inline namespace v1 {

//! The reason why a backend refused to accept new work
enum class submission_failure {
    stopped,   //!< The backend was stopped/closed, or its runtime is no longer running
    saturated, //!< The backend reached its configured limit of pending work
};

/**
 * @brief      Exception thrown by `spawn()` / `schedule()` when the backend rejects the work.
 *
 * This is a recoverable condition. When this is thrown, the work was not accepted by the backend;
 * the task body will never be executed and the subscription passed to `spawn()` is closed.
 */
struct submission_error : std::runtime_error {
    explicit submission_error(submission_failure reason)
        : std::runtime_error(reason == submission_failure::stopped
                                     ? "backend stopped; cannot accept new work"
                                     : "backend saturated; cannot accept new work")
        , reason_(reason) {}

    //! Returns the reason for which the work was rejected
    submission_failure reason() const noexcept { return reason_; }

private:
    submission_failure reason_;
};

} // namespace v1

} // namespace rxsched
