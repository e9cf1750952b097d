#include <catch2/catch_test_macros.hpp>
#include "cache/resource_pool_manager.hpp"
#include "core/scheduler.hpp"
#include "quality/adaptive_lod_controller.hpp"
#include "scheduling/idle_task_scheduler.hpp"
#include "testing/manual_clock.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace mrc;
using cache::ResourcePool;
using cache::ResourcePoolManager;

namespace {

struct Glyph { int id = 0; };

quality::LodConfig tier(int64_t entries, int64_t bytes) {
    quality::LodConfig c;
    c.pool_capacity_entries = entries;
    c.pool_capacity_bytes = bytes;
    return c;
}

void fill(ResourcePool<Glyph>& pool, int n) {
    for(int i = 0; i < n; ++i) pool.put("g" + std::to_string(i), std::make_shared<Glyph>(Glyph{i}), 100);
}

} // namespace

TEST_CASE("pools are sized by their share of the tier budget", "[pool][manager]") {
    ResourcePool<Glyph> markers("markers", 1000, 1LL << 30);
    ResourcePool<Glyph> labels("labels", 1000, 1LL << 30);
    ResourcePoolManager mgr;
    mgr.register_pool(markers);
    mgr.register_pool(labels, 0.5);

    mgr.apply_lod(quality::LodMode::Medium, tier(50, 20LL * 1024 * 1024));
    REQUIRE(markers.limits().max_entries == 50);
    REQUIRE(markers.limits().max_bytes == 20LL * 1024 * 1024);
    REQUIRE(labels.limits().max_entries == 25);
    REQUIRE(labels.limits().max_bytes == 10LL * 1024 * 1024);

    // Tiny shares never go below the pool minimums.
    ResourcePool<Glyph> tiny("tiny", 10, 1LL << 20);
    mgr.register_pool(tiny, 0.001);
    REQUIRE(tiny.limits().max_entries == 1);
    REQUIRE(tiny.limits().max_bytes == 20LL * 1024 * 1024 / 1000);
}

TEST_CASE("registry lookups", "[pool][manager]") {
    ResourcePool<Glyph> a("a", 10, 1 << 20);
    ResourcePool<Glyph> b("b", 10, 1 << 20);
    ResourcePoolManager mgr;
    mgr.register_pool(a);
    mgr.register_pool(b);
    mgr.register_pool(a, 2.0); // updates share only
    REQUIRE(mgr.pool_count() == 2);
    REQUIRE(mgr.find("b") == &b);
    REQUIRE(mgr.find("zzz") == nullptr);
    REQUIRE(mgr.unregister_pool(b));
    REQUIRE_FALSE(mgr.unregister_pool(b));
    REQUIRE(mgr.find("b") == nullptr);
    REQUIRE_THROWS_AS(mgr.register_pool(b, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(mgr.register_pool(b, -1.0), std::invalid_argument);
}

TEST_CASE("shrinking pools are trimmed in an idle slot", "[pool][manager]") {
    testing::ManualClock clock;
    core::FrameDrivenScheduler host(clock);
    scheduling::IdleTaskScheduler idle(host, clock);

    ResourcePool<Glyph> pool("markers", 10, 1 << 20);
    fill(pool, 10);
    ResourcePoolManager mgr;
    mgr.attach_idle_scheduler(&idle);
    mgr.register_pool(pool);

    mgr.apply_lod(quality::LodMode::Low, tier(4, 1 << 20));
    REQUIRE(pool.size() == 10); // lazy until the slot runs
    REQUIRE(mgr.trims_scheduled() == 1);
    REQUIRE(idle.queued() == 1);

    host.run_idle(0.0);
    REQUIRE(pool.size() == 4);
    REQUIRE(pool.stats().evictions == 6);
}

TEST_CASE("without an idle scheduler pools are trimmed immediately", "[pool][manager]") {
    ResourcePool<Glyph> pool("markers", 10, 1 << 20);
    fill(pool, 10);
    ResourcePoolManager mgr;
    mgr.register_pool(pool);
    mgr.apply_lod(quality::LodMode::Low, tier(3, 1 << 20));
    REQUIRE(pool.size() == 3);
    REQUIRE(mgr.trims_scheduled() == 0);
}

TEST_CASE("manager follows the controller", "[pool][manager][lod]") {
    testing::ManualClock clock;
    quality::AdaptiveLodController ctl(clock);
    ResourcePool<Glyph> pool("markers", 5, 1 << 20);
    ResourcePoolManager mgr;
    mgr.register_pool(pool);
    ctl.add_consumer(mgr);
    REQUIRE(pool.limits().max_entries == 100);

    ctl.force_mode(quality::LodMode::Low);
    REQUIRE(pool.limits().max_entries == 30);
    REQUIRE(pool.limits().max_bytes == 10LL * 1024 * 1024);
}

TEST_CASE("aggregate stats and trim_all", "[pool][manager]") {
    ResourcePool<Glyph> a("a", 10, 1 << 20);
    ResourcePool<Glyph> b("b", 10, 1 << 20);
    fill(a, 6);
    fill(b, 6);
    ResourcePoolManager mgr;
    mgr.register_pool(a);
    mgr.register_pool(b);
    a.get("g0");
    b.get("nope");
    REQUIRE(mgr.hit_rate() == 0.5);

    a.configure(2, 1 << 20);
    b.configure(5, 1 << 20);
    REQUIRE(mgr.trim_all() == 5);
    auto st = mgr.stats();
    REQUIRE(st.size() == 2);
    REQUIRE(st[0].entries == 2);
    REQUIRE(st[1].entries == 5);
}
