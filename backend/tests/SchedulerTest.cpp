#include "engine/SchedulerService.hpp"

#include <chrono>
#include <stdexcept>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using tmax::engine::SchedulerService;

TEST_CASE("scheduler runs tasks when they are due")
{
    SchedulerService scheduler;
    int fast = 0;
    int slow = 0;
    scheduler.schedule("fast", 100ms, [&] { ++fast; });
    scheduler.schedule("slow", 1s, [&] { ++slow; });
    auto const start = SchedulerService::Clock::now();

    CHECK(scheduler.tick(start) == 0);
    CHECK(scheduler.tick(start + 150ms) == 1);
    CHECK(fast == 1);
    CHECK(slow == 0);

    CHECK(scheduler.tick(start + 1100ms) == 2);
    CHECK(fast == 2);
    CHECK(slow == 1);
}

TEST_CASE("scheduler reports the wait until the next task")
{
    SchedulerService scheduler;
    CHECK(scheduler.time_until_next_task(SchedulerService::Clock::now()) >=
          std::chrono::hours(1));

    scheduler.schedule("task", 500ms, [] {});
    auto const now = SchedulerService::Clock::now();
    auto wait = scheduler.time_until_next_task(now);
    CHECK(wait <= 500ms);
    CHECK(wait > 400ms);
    CHECK(scheduler.time_until_next_task(now + 1s) == 0ms);
}

TEST_CASE("cancelled tasks stop running")
{
    SchedulerService scheduler;
    int runs = 0;
    auto id = scheduler.schedule("task", 10ms, [&] { ++runs; });
    auto const start = SchedulerService::Clock::now();
    scheduler.tick(start + 20ms);
    CHECK(runs == 1);

    scheduler.cancel(id);
    CHECK(scheduler.size() == 0);
    scheduler.tick(start + 1s);
    CHECK(runs == 1);
}

TEST_CASE("a throwing task does not stop the others")
{
    SchedulerService scheduler;
    int runs = 0;
    scheduler.schedule("bad", 10ms, [] { throw std::runtime_error("boom"); });
    scheduler.schedule("good", 10ms, [&] { ++runs; });
    CHECK(scheduler.tick(SchedulerService::Clock::now() + 50ms) == 2);
    CHECK(runs == 1);
    CHECK(scheduler.size() == 2);
}
