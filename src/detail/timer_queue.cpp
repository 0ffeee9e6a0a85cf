#include "rxsched/detail/timer_queue.hpp"

namespace rxsched {
namespace detail {

void timer_queue::push(clock::time_point deadline, task_function work, abort_registration reg) {
    entries_.push(entry{deadline, next_seq_++, std::move(work), std::move(reg)});
}

std::size_t timer_queue::pop_due(clock::time_point now, std::vector<task_function>& out) {
    std::size_t num_dropped = 0;
    while (!entries_.empty() && entries_.top().deadline_ <= now) {
        // priority_queue::top() is const; the entry is about to be popped anyway
        auto& top = const_cast<entry&>(entries_.top()); // NOLINT
        if (top.reg_.is_aborted())
            num_dropped++;
        else
            out.emplace_back(std::move(top.work_));
        entries_.pop();
    }
    return num_dropped;
}

std::size_t timer_queue::purge_aborted() {
    std::vector<entry> kept;
    kept.reserve(entries_.size());
    std::size_t num_dropped = 0;
    while (!entries_.empty()) {
        auto& top = const_cast<entry&>(entries_.top()); // NOLINT
        if (top.reg_.is_aborted())
            num_dropped++;
        else
            kept.emplace_back(std::move(top));
        entries_.pop();
    }
    for (auto& e : kept)
        entries_.push(std::move(e));
    return num_dropped;
}

std::size_t timer_queue::clear() noexcept {
    std::size_t num_dropped = entries_.size();
    while (!entries_.empty())
        entries_.pop();
    return num_dropped;
}

} // namespace detail
} // namespace rxsched
