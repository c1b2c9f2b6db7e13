#include <nodememo/eviction/Scheduler.hpp>

#include <algorithm>

namespace NM {

auto ManualScheduler::schedule(Duration delay, Callback callback) -> TimerId {
    auto const id  = nextId_++;
    auto const due = now_ + std::max(delay, Duration{0});
    timers_.emplace(Slot{due, id}, std::move(callback));
    dueById_.emplace(id, due);
    return id;
}

auto ManualScheduler::cancel(TimerId id) -> bool {
    auto it = dueById_.find(id);
    if (it == dueById_.end()) {
        return false;
    }
    timers_.erase(Slot{it->second, id});
    dueById_.erase(it);
    return true;
}

auto ManualScheduler::advance(Duration delta) -> std::size_t {
    auto const target = now_ + std::max(delta, Duration{0});
    std::size_t fired = 0;
    while (!timers_.empty()) {
        auto first = timers_.begin();
        if (first->first.first > target) {
            break;
        }
        now_          = first->first.first;
        auto callback = std::move(first->second);
        dueById_.erase(first->first.second);
        timers_.erase(first);
        ++fired;
        if (callback) {
            callback();
        }
    }
    now_ = target;
    return fired;
}

} // namespace NM
