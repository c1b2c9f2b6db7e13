#include <doctest/doctest.h>

#include <nodememo/eviction/Scheduler.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

using namespace NM;
using namespace std::chrono_literals;

TEST_SUITE("eviction.scheduler") {

TEST_CASE("timers fire in due order as virtual time advances") {
    ManualScheduler          scheduler;
    std::vector<std::string> fired;

    scheduler.schedule(300ms, [&] { fired.push_back("late"); });
    scheduler.schedule(100ms, [&] { fired.push_back("early"); });
    scheduler.schedule(100ms, [&] { fired.push_back("early-second"); });

    CHECK(scheduler.advance(99ms) == 0);
    CHECK(scheduler.advance(1ms) == 2);
    CHECK(fired == std::vector<std::string>{"early", "early-second"});
    CHECK(scheduler.now() == 100ms);

    CHECK(scheduler.advance(1s) == 1);
    CHECK(fired.back() == "late");
    CHECK(scheduler.now() == 1100ms);
    CHECK(scheduler.pendingCount() == 0);
}

TEST_CASE("cancelled timers never fire") {
    ManualScheduler scheduler;
    int             calls = 0;

    auto id = scheduler.schedule(50ms, [&] { ++calls; });
    CHECK(scheduler.isPending(id));
    CHECK(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(id));
    scheduler.advance(1s);
    CHECK(calls == 0);
}

TEST_CASE("callbacks may schedule follow-up timers inside the same advance") {
    ManualScheduler scheduler;
    std::vector<Scheduler::Duration> ticks;

    std::function<void()> tick = [&] {
        ticks.push_back(scheduler.now());
        if (ticks.size() < 3) {
            scheduler.schedule(30ms, tick);
        }
    };
    scheduler.schedule(30ms, tick);

    CHECK(scheduler.advance(100ms) == 3);
    CHECK(ticks == std::vector<Scheduler::Duration>{30ms, 60ms, 90ms});
}

} // TEST_SUITE
