#include <catch2/catch_test_macros.hpp>
#include "cache/resource_pool.hpp"

#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using mrc::cache::ResourcePool;

namespace {

struct Bitmap {
    explicit Bitmap(int id_) : id(id_) {}
    int id = 0;
};

std::shared_ptr<Bitmap> bmp(int id) { return std::make_shared<Bitmap>(id); }

constexpr int64_t kLarge = 64LL * 1024 * 1024;

} // namespace

TEST_CASE("pool with two slots evicts the oldest of three", "[pool][scenario]") {
    ResourcePool<Bitmap> pool("icons", 2, kLarge);
    pool.put("a", bmp(1), 100);
    pool.put("b", bmp(2), 100);
    pool.put("c", bmp(3), 100);
    REQUIRE(pool.size() == 2);
    REQUIRE(pool.stats().evictions == 1);
    REQUIRE_FALSE(pool.contains("a"));
    REQUIRE(pool.contains("b"));
    REQUIRE(pool.contains("c"));
}

TEST_CASE("get returns the stored reference and refreshes recency", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 2, kLarge);
    auto a = bmp(1);
    pool.put("a", a, 10);
    pool.put("b", bmp(2), 10);
    REQUIRE(pool.get("a") == a);
    REQUIRE(pool.last_access("a") > pool.last_access("b"));
    pool.put("c", bmp(3), 10); // evicts b, a was touched
    REQUIRE(pool.contains("a"));
    REQUIRE_FALSE(pool.contains("b"));
    REQUIRE(pool.get("b") == nullptr);

    auto st = pool.stats();
    REQUIRE(st.hits == 1);
    REQUIRE(st.misses == 1);
    REQUIRE(st.hit_rate() == 0.5);
}

TEST_CASE("byte limit evicts by size", "[pool]") {
    ResourcePool<Bitmap> pool("tiles", 10, 3000);
    for(int i = 0; i < 4; ++i) pool.put("t" + std::to_string(i), bmp(i), 1000);
    REQUIRE(pool.size() == 3);
    REQUIRE(pool.bytes() == 3000);
    REQUIRE_FALSE(pool.contains("t0"));
}

TEST_CASE("oversized resources are rejected without touching the pool", "[pool]") {
    ResourcePool<Bitmap> pool("tiles", 10, 3000);
    pool.put("keep", bmp(1), 1000);
    REQUIRE_FALSE(pool.put("huge", bmp(2), 5000));
    REQUIRE(pool.size() == 1);
    REQUIRE(pool.contains("keep"));
    REQUIRE(pool.stats().rejected == 1);
    REQUIRE(pool.stats().evictions == 0);
}

TEST_CASE("replacing an entry updates size and releases the old resource", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 10, kLarge);
    std::vector<int> released;
    pool.set_eviction_callback([&](const std::string&, const std::shared_ptr<Bitmap>& r) { released.push_back(r->id); });
    pool.put("a", bmp(1), 100);
    pool.put("a", bmp(2), 300);
    REQUIRE(pool.size() == 1);
    REQUIRE(pool.bytes() == 300);
    REQUIRE(pool.get("a")->id == 2);
    REQUIRE(released == std::vector<int>{1});

    REQUIRE(pool.remove("a"));
    REQUIRE_FALSE(pool.remove("a"));
    REQUIRE(released == std::vector<int>{1, 2});
    REQUIRE(pool.bytes() == 0);
}

TEST_CASE("invalid puts throw", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 10, kLarge);
    REQUIRE_THROWS_AS(pool.put("x", nullptr, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(pool.put("x", bmp(1), -1), std::invalid_argument);
    REQUIRE(pool.size() == 0);
}

TEST_CASE("configure is applied by the next trim", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 10, kLarge);
    for(int i = 0; i < 5; ++i) pool.put(std::to_string(i), bmp(i), 100);
    pool.configure(2, kLarge);
    REQUIRE(pool.size() == 5);
    REQUIRE(pool.over_capacity());
    REQUIRE(pool.trim() == 3);
    REQUIRE(pool.size() == 2);
    REQUIRE(pool.trim() == 0);
    REQUIRE_FALSE(pool.over_capacity());
    REQUIRE(pool.contains("3"));
    REQUIRE(pool.contains("4"));
}

TEST_CASE("limits below the minimum are clamped", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 0, -5);
    REQUIRE(pool.limits().max_entries == 1);
    REQUIRE(pool.limits().max_bytes == 1024);
    pool.configure(-3, 0);
    REQUIRE(pool.limits().max_entries == 1);
    REQUIRE(pool.limits().max_bytes == 1024);
}

TEST_CASE("pool bounds hold under any insertion order", "[pool][property]") {
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> key(0, 30);
    std::uniform_int_distribution<int> size(0, 2000);
    std::uniform_int_distribution<int> op(0, 9);

    ResourcePool<Bitmap> pool("random", 8, 6000);
    for(int i = 0; i < 2000; ++i) {
        const int o = op(rng);
        const std::string k = "k" + std::to_string(key(rng));
        if(o < 6) {
            pool.put(k, bmp(i), size(rng));
        } else if(o < 8) {
            pool.get(k);
        } else if(o == 8) {
            pool.configure(1 + key(rng) % 8, 2000 + size(rng) * 2);
            pool.trim();
            REQUIRE(pool.trim() == 0);
        } else {
            pool.remove(k);
        }
        REQUIRE(static_cast<int64_t>(pool.size()) <= pool.limits().max_entries);
        REQUIRE(pool.bytes() <= pool.limits().max_bytes);
    }
}

TEST_CASE("get_or_create loads once", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 4, kLarge);
    int loads = 0;
    auto loader = [&] { ++loads; return std::make_pair(bmp(7), int64_t{64}); };
    auto first = pool.get_or_create("pin", loader);
    auto second = pool.get_or_create("pin", loader);
    REQUIRE(loads == 1);
    REQUIRE(first == second);

    auto none = pool.get_or_create("missing", [] { return std::make_pair(std::shared_ptr<Bitmap>(), int64_t{0}); });
    REQUIRE(none == nullptr);
    REQUIRE_FALSE(pool.contains("missing"));
}

TEST_CASE("clear releases everything", "[pool]") {
    ResourcePool<Bitmap> pool("icons", 4, kLarge);
    int released = 0;
    pool.set_eviction_callback([&](const std::string&, const std::shared_ptr<Bitmap>&) { ++released; });
    pool.put("a", bmp(1), 1);
    pool.put("b", bmp(2), 1);
    pool.clear();
    REQUIRE(pool.size() == 0);
    REQUIRE(pool.bytes() == 0);
    REQUIRE(released == 2);
    REQUIRE(mrc::cache::to_string(pool.stats()).find("icons: 0/4 entries") == 0);
}
