#include <catch2/catch_test_macros.hpp>
#include "core/scheduler.hpp"
#include "scheduling/idle_task_scheduler.hpp"
#include "testing/manual_clock.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace mrc;
using scheduling::IdleTaskPriority;
using scheduling::IdleTaskScheduler;

TEST_CASE("idle tasks run by priority then FIFO", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    std::vector<std::string> order;

    idle.schedule_task([&]{ order.push_back("low"); }, IdleTaskPriority::Low);
    idle.schedule_task([&]{ order.push_back("medium"); }, IdleTaskPriority::Medium);
    idle.schedule_task([&]{ order.push_back("high1"); }, IdleTaskPriority::High);
    idle.schedule_task([&]{ order.push_back("critical"); }, IdleTaskPriority::Critical);
    idle.schedule_task([&]{ order.push_back("high2"); }, IdleTaskPriority::High);

    REQUIRE(host.pending_idle() == 1); // one slot requested for all five
    host.run_idle(0.0);
    REQUIRE(order == std::vector<std::string>{"critical", "high1", "high2", "medium", "low"});
    auto st = idle.stats();
    REQUIRE(st.scheduled == 5);
    REQUIRE(st.completed == 5);
    REQUIRE(st.queued == 0);
    REQUIRE(st.slots == 1);
    REQUIRE(host.pending_idle() == 0);
}

TEST_CASE("tasks stop when the frame budget runs short", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock); // 16ms budget, 4ms minimum
    int ran = 0;
    for(int i = 0; i < 5; ++i) idle.schedule_task([&]{ clock.advance(5.0); ++ran; });

    host.run_idle(0.0);
    REQUIRE(ran == 3); // 16 -> 11 -> 6 -> 1 left
    REQUIRE(idle.stats().deferred == 1);
    REQUIRE(idle.queued() == 2);
    REQUIRE(host.pending_idle() == 1);

    host.run_idle(0.0);
    REQUIRE(ran == 5);
    REQUIRE(idle.stats().overruns == 0);
}

TEST_CASE("a busy frame defers every task", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    int ran = 0;
    idle.schedule_task([&]{ ++ran; });
    host.run_idle(14.0);
    REQUIRE(ran == 0);
    REQUIRE(idle.stats().deferred == 1);
    host.run_idle(2.0);
    REQUIRE(ran == 1);
}

TEST_CASE("overruns are measured after the task", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    idle.schedule_task([&]{ clock.advance(20.0); }, IdleTaskPriority::Medium, "slow");
    idle.schedule_task([&]{ clock.advance(1.0); }, IdleTaskPriority::Medium, "fast");
    host.run_idle(0.0);

    auto st = idle.stats();
    REQUIRE(st.completed == 1);
    REQUIRE(st.overruns == 1);
    REQUIRE(st.overrun_rate() == 1.0);
    REQUIRE(st.queued == 1);

    host.run_idle(0.0);
    st = idle.stats();
    REQUIRE(st.completed == 2);
    REQUIRE(st.overrun_rate() == 0.5);
}

TEST_CASE("failing tasks are counted and the slot continues", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    bool after = false;
    idle.schedule_task([]{ throw std::runtime_error("decode failed"); }, IdleTaskPriority::High, "bad");
    idle.schedule_task([&]{ after = true; });
    host.run_idle(0.0);
    REQUIRE(after);
    REQUIRE(idle.stats().failed == 1);
    REQUIRE(idle.stats().completed == 1);
}

TEST_CASE("tasks queued from a task wait for the next slot", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    int chained = 0;
    idle.schedule_task([&]{ idle.schedule_task([&]{ ++chained; }, IdleTaskPriority::Critical); });
    host.run_idle(0.0);
    REQUIRE(chained == 0);
    REQUIRE(idle.queued() == 1);
    host.run_idle(0.0);
    REQUIRE(chained == 1);
}

TEST_CASE("max wait tracks queueing delay", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    idle.schedule_task([]{});
    clock.advance(50.0);
    host.run_idle(0.0);
    REQUIRE(idle.stats().max_wait_ms == 50.0);
}

TEST_CASE("shutdown drops queued tasks", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    int ran = 0;
    idle.schedule_task([&]{ ++ran; });
    idle.schedule_task([&]{ ++ran; });
    idle.shutdown();
    host.run_idle(0.0);
    REQUIRE(ran == 0);
    REQUIRE(idle.stats().dropped == 2);
    REQUIRE(idle.schedule_task([&]{ ++ran; }) == 0);
    REQUIRE(idle.is_shut_down());
}

TEST_CASE("empty actions are rejected", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    REQUIRE_THROWS_AS(idle.schedule_task({}), std::invalid_argument);
}

TEST_CASE("destroying the scheduler with a pending slot is safe", "[idle]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    int ran = 0;
    {
        IdleTaskScheduler idle(host, clock);
        idle.schedule_task([&]{ ++ran; });
    }
    REQUIRE(host.pending_idle() == 1);
    host.run_idle(0.0);
    REQUIRE(ran == 0);
}

TEST_CASE("gc hints respect the cooldown", "[idle][gc]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    IdleTaskScheduler idle(host, clock);
    std::vector<std::string> reasons;
    idle.set_gc_hint_sink([&](const std::string& r) { reasons.push_back(r); });

    REQUIRE(idle.maybe_gc_hint("first"));
    REQUIRE_FALSE(idle.maybe_gc_hint("too soon"));
    clock.advance(119999.0);
    REQUIRE_FALSE(idle.maybe_gc_hint("still too soon"));
    clock.advance(1.0);
    REQUIRE(idle.maybe_gc_hint("second"));
    REQUIRE(reasons == std::vector<std::string>{"first", "second"});
    REQUIRE(idle.stats().gc_hints == 2);
}
