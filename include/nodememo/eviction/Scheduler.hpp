#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

#include <parallel_hashmap/phmap.h>

namespace NM {

using TimerId = std::uint64_t;

/**
 * Scheduler: single-threaded timer queue used by the EvictionController.
 *
 * Contract
 * --------
 * - schedule(...) queues a one-shot callback `delay` after the scheduler's
 *   current time and returns a non-zero id.
 * - cancel(id) drops a pending timer; returns false when it already fired or
 *   was never scheduled.
 * - Callbacks run on the thread driving the scheduler, one at a time, and may
 *   schedule or cancel other timers.
 */
struct Scheduler {
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    virtual ~Scheduler() = default;

    virtual auto schedule(Duration delay, Callback callback) -> TimerId = 0;
    virtual auto cancel(TimerId id) -> bool                              = 0;
    virtual auto now() const -> Duration                                 = 0;
};

/**
 * ManualScheduler: virtual time. Nothing fires until the owner calls
 * advance(); timers due at the same instant fire in scheduling order.
 */
class ManualScheduler final : public Scheduler {
public:
    auto schedule(Duration delay, Callback callback) -> TimerId override;
    auto cancel(TimerId id) -> bool override;
    auto now() const -> Duration override { return now_; }

    // Moves time forward by `delta`, firing every timer that falls due on the
    // way (including ones scheduled by callbacks). Returns the number fired.
    auto advance(Duration delta) -> std::size_t;

    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t { return timers_.size(); }
    [[nodiscard]] auto isPending(TimerId id) const -> bool { return dueById_.contains(id); }

private:
    using Slot = std::pair<Duration, TimerId>;

    std::map<Slot, Callback>                   timers_;
    phmap::flat_hash_map<TimerId, Duration>    dueById_;
    Duration                                   now_{0};
    TimerId                                    nextId_ = 1;
};

} // namespace NM
