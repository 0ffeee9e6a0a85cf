#pragma once

#include "../abort_handle.hpp"
#include "../deferred_task.hpp"

#include <chrono>
#include <cstdint>
#include <queue>
#include <vector>

namespace rxsched {
namespace detail {

/**
 * @brief      Queue of delayed work, ordered by deadline.
 *
 * Work with the same deadline is kept in insertion order. Each entry keeps the abort registration
 * of its work, so that aborted entries can be dropped before their deadline.
 *
 * This is not thread-safe.
 */
class timer_queue {
public:
    using clock = std::chrono::steady_clock;

    //! Adds work to be executed at the given deadline
    void push(clock::time_point deadline, task_function work, abort_registration reg);

    //! Checks if there is no delayed work in the queue
    bool empty() const noexcept { return entries_.empty(); }
    //! The number of entries in the queue (including the aborted ones not purged yet)
    std::size_t size() const noexcept { return entries_.size(); }

    //! The earliest deadline in the queue. The queue must not be empty.
    clock::time_point next_deadline() const { return entries_.top().deadline_; }

    //! Moves the work that is due at `now` to `out`, in deadline order.
    //! Returns the number of entries that were dropped because they were aborted.
    std::size_t pop_due(clock::time_point now, std::vector<task_function>& out);

    //! Drops all the entries that were aborted. Returns the number of dropped entries.
    std::size_t purge_aborted();

    //! Drops all the entries. Returns the number of dropped entries.
    std::size_t clear() noexcept;

private:
    struct entry {
        clock::time_point deadline_;
        std::uint64_t seq_;
        task_function work_;
        abort_registration reg_;
    };
    struct later_first {
        bool operator()(const entry& l, const entry& r) const noexcept {
            return l.deadline_ > r.deadline_ || (l.deadline_ == r.deadline_ && l.seq_ > r.seq_);
        }
    };

    std::priority_queue<entry, std::vector<entry>, later_first> entries_;
    std::uint64_t next_seq_{0};
};

} // namespace detail
} // namespace rxsched
