#include <catch2/catch_test_macros.hpp>
#include "cache/resource_pool_manager.hpp"
#include "core/scheduler.hpp"
#include "quality/adaptive_lod_controller.hpp"
#include "scheduling/idle_task_scheduler.hpp"
#include "testing/manual_clock.hpp"
#include "warmup/startup_warm_cycle.hpp"
#include "warmup/warm_steps.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace mrc;
using warmup::StartupWarmCycle;
using warmup::WarmContext;
using warmup::WarmState;
using warmup::WarmStep;

namespace {

struct Harness {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host{clock};
    scheduling::IdleTaskScheduler idle{host, clock};

    // Runs idle slots until nothing is queued or `max_slots` have run.
    int drain(int max_slots = 32) {
        int slots = 0;
        while(host.pending_idle() > 0 && slots < max_slots) {
            host.run_idle(0.0);
            ++slots;
        }
        return slots;
    }
};

std::vector<WarmStep> recording_steps(std::vector<std::string>& log, int n) {
    std::vector<WarmStep> steps;
    for(int i = 0; i < n; ++i) {
        const std::string name = "step" + std::to_string(i);
        steps.push_back({name, [&log, name](const WarmContext&) { log.push_back(name); }});
    }
    return steps;
}

struct FakeWarmer final : warmup::IAssetWarmer {
    void prebuild_fixed_assets() override { ++fixed; }
    void prebuild_selection_variants() override { ++variants; }
    void prefetch_tile(const warmup::TileCoord& t) override {
        if(t == fail_tile) throw std::runtime_error("tile server unavailable");
        tiles.push_back(t);
    }
    int fixed = 0;
    int variants = 0;
    warmup::TileCoord fail_tile{-1, -1, -1};
    std::vector<warmup::TileCoord> tiles;
};

} // namespace

TEST_CASE("cancel after the second step stops the chain", "[warmup][scenario]") {
    Harness h;
    std::vector<std::string> ran;
    StartupWarmCycle cycle(h.idle, recording_steps(ran, 4));
    bool completed = false;
    REQUIRE(cycle.run({}, [&] { completed = true; }, [&](size_t done, size_t) {
        if(done == 2) cycle.cancel();
    }));

    h.drain();
    REQUIRE(cycle.state() == WarmState::Cancelled);
    REQUIRE(cycle.steps_run() == 2);
    REQUIRE(ran == std::vector<std::string>{"step0", "step1"});
    REQUIRE_FALSE(completed);
    REQUIRE(h.idle.queued() == 0);
}

TEST_CASE("steps run one per idle slot in order", "[warmup]") {
    Harness h;
    std::vector<std::string> ran;
    StartupWarmCycle cycle(h.idle, recording_steps(ran, 3));
    int completions = 0;
    std::vector<size_t> progress;
    size_t reported_total = 0;
    cycle.run({}, [&] { ++completions; }, [&](size_t done, size_t total) {
        reported_total = total;
        progress.push_back(done);
    });
    REQUIRE(cycle.state() == WarmState::Running);

    h.host.run_idle(0.0);
    REQUIRE(ran.size() == 1);
    REQUIRE(cycle.progress() > 0.33);
    REQUIRE(cycle.progress() < 0.34);

    REQUIRE(h.drain() == 2);
    REQUIRE(ran == std::vector<std::string>{"step0", "step1", "step2"});
    REQUIRE(progress == std::vector<size_t>{1, 2, 3});
    REQUIRE(reported_total == 3);
    REQUIRE(completions == 1);
    REQUIRE(cycle.state() == WarmState::Completed);
    REQUIRE(cycle.progress() == 1.0);
}

TEST_CASE("a failing step is counted and the chain continues", "[warmup]") {
    Harness h;
    std::vector<WarmStep> steps;
    int after = 0;
    steps.push_back({"broken", [](const WarmContext&) { throw std::runtime_error("no atlas"); }});
    steps.push_back({"next", [&](const WarmContext&) { ++after; }});
    StartupWarmCycle cycle(h.idle, std::move(steps));
    bool completed = false;
    cycle.run({}, [&] { completed = true; });
    h.drain();
    REQUIRE(completed);
    REQUIRE(after == 1);
    REQUIRE(cycle.failed_steps() == 1);
    REQUIRE(cycle.steps_run() == 2);
}

TEST_CASE("run is rejected while running and allowed after completion", "[warmup]") {
    Harness h;
    std::vector<std::string> ran;
    StartupWarmCycle cycle(h.idle, recording_steps(ran, 2));
    REQUIRE(cycle.run({}));
    REQUIRE_FALSE(cycle.run({}));
    h.drain();
    REQUIRE(ran.size() == 2);

    REQUIRE(cycle.run({}));
    h.drain();
    REQUIRE(ran.size() == 4);
    REQUIRE(cycle.state() == WarmState::Completed);
}

TEST_CASE("cancel between steps allows an immediate re-run", "[warmup]") {
    Harness h;
    std::vector<std::string> ran;
    StartupWarmCycle cycle(h.idle, recording_steps(ran, 4));
    REQUIRE(cycle.run({}));
    h.host.run_idle(0.0);
    h.host.run_idle(0.0);
    REQUIRE(ran.size() == 2);

    cycle.cancel();
    REQUIRE(cycle.state() == WarmState::Cancelled);
    bool completed = false;
    REQUIRE(cycle.run({}, [&] { completed = true; }));
    h.drain();
    REQUIRE(ran.size() == 6);
    REQUIRE(ran.back() == "step3");
    REQUIRE(completed);
    REQUIRE(cycle.state() == WarmState::Completed);
}

TEST_CASE("cancel after the idle scheduler shut down", "[warmup]") {
    Harness h;
    std::vector<std::string> ran;
    StartupWarmCycle cycle(h.idle, recording_steps(ran, 3));
    REQUIRE(cycle.run({}));
    h.idle.shutdown();
    REQUIRE(cycle.state() == WarmState::Running);

    cycle.cancel();
    REQUIRE(cycle.state() == WarmState::Cancelled);
    h.drain();
    REQUIRE(ran.empty());
}

TEST_CASE("a step may cancel its own cycle", "[warmup]") {
    Harness h;
    StartupWarmCycle* self = nullptr;
    int ran = 0;
    std::vector<WarmStep> steps;
    steps.push_back({"first", [&](const WarmContext&) { ++ran; self->cancel(); }});
    steps.push_back({"second", [&](const WarmContext&) { ++ran; }});
    StartupWarmCycle cycle(h.idle, std::move(steps));
    self = &cycle;
    cycle.run({});
    h.drain();
    REQUIRE(ran == 1);
    REQUIRE(cycle.state() == WarmState::Cancelled);
}

TEST_CASE("empty cycles complete immediately", "[warmup]") {
    Harness h;
    StartupWarmCycle cycle(h.idle, {});
    bool completed = false;
    cycle.run({}, [&] { completed = true; });
    REQUIRE(completed);
    REQUIRE(cycle.state() == WarmState::Completed);
    REQUIRE(cycle.progress() == 1.0);
    REQUIRE(h.host.pending_idle() == 0);
}

TEST_CASE("steps without a function are rejected", "[warmup]") {
    Harness h;
    std::vector<WarmStep> steps{{"empty", {}}};
    REQUIRE_THROWS_AS(StartupWarmCycle(h.idle, steps), std::invalid_argument);
}

TEST_CASE("destroying a running cycle is safe", "[warmup]") {
    Harness h;
    std::vector<std::string> ran;
    {
        StartupWarmCycle cycle(h.idle, recording_steps(ran, 3));
        cycle.run({});
    }
    h.drain();
    REQUIRE(ran.empty());
}

TEST_CASE("standard steps prepare assets, pools and tiles", "[warmup]") {
    Harness h;
    quality::AdaptiveLodController controller(h.clock);
    cache::ResourcePool<int> icons("icons", 5, 1 << 20);
    cache::ResourcePoolManager pools;
    pools.register_pool(icons);
    FakeWarmer warmer;

    StartupWarmCycle cycle(h.idle, warmup::standard_warm_steps(warmer, controller, pools));
    REQUIRE(cycle.total_steps() == 4);
    WarmContext ctx;
    ctx.center = {0.0, 0.0};
    ctx.zoom = 4.0;

    SECTION("all tiles fetched") {
        cycle.run(ctx);
        h.drain();
        REQUIRE(cycle.state() == WarmState::Completed);
        REQUIRE(warmer.fixed == 1);
        REQUIRE(warmer.variants == 1);
        REQUIRE(icons.limits().max_entries == 100);
        REQUIRE(warmer.tiles.size() == 9);
        REQUIRE(warmer.tiles[4] == warmup::TileCoord{8, 8, 4});
    }

    SECTION("a failing tile is skipped") {
        warmer.fail_tile = warmup::TileCoord{7, 7, 4};
        cycle.run(ctx);
        h.drain();
        REQUIRE(cycle.state() == WarmState::Completed);
        REQUIRE(cycle.failed_steps() == 0);
        REQUIRE(warmer.tiles.size() == 8);
    }
}
