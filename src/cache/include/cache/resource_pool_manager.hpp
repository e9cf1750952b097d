#pragma once
#include <string>
#include <vector>

#include "cache/resource_pool.hpp"
#include "quality/lod_types.hpp"

namespace mrc::scheduling { class IdleTaskScheduler; }

namespace mrc::cache {

/**
 * @brief Registry of resource pools sized from the active quality tier
 *
 * Pools are registered explicitly and not owned. Each pool receives `share`
 * of the tier's entry and byte budget (at least the pool minimums). When a
 * reconfiguration leaves a pool over capacity, a trim is queued as a
 * High-priority idle task if a scheduler is attached, otherwise the pool is
 * trimmed immediately.
 */
class ResourcePoolManager final : public quality::ILodConsumer {
public:
    ResourcePoolManager() = default;
    ResourcePoolManager(const ResourcePoolManager&) = delete;
    ResourcePoolManager& operator=(const ResourcePoolManager&) = delete;

    // Registering a pool twice updates its share. Throws on share <= 0 or NaN.
    void register_pool(IResourcePool& pool, double share = 1.0);
    bool unregister_pool(const IResourcePool& pool);

    IResourcePool* find(const std::string& name) const;
    std::vector<IResourcePool*> pools() const;
    size_t pool_count() const { return entries_.size(); }

    void attach_idle_scheduler(scheduling::IdleTaskScheduler* scheduler) { idle_ = scheduler; }

    void apply_lod(quality::LodMode mode, const quality::LodConfig& config) override;

    // Trims every pool now; returns the total number of evictions.
    size_t trim_all();
    std::vector<PoolStats> stats() const;
    // Hits over lookups across all pools.
    double hit_rate() const;
    uint64_t trims_scheduled() const { return trims_scheduled_; }

private:
    struct Registered {
        IResourcePool* pool = nullptr;
        double share = 1.0;
    };

    void configure(Registered& r, const quality::LodConfig& config);

    std::vector<Registered> entries_;
    scheduling::IdleTaskScheduler* idle_ = nullptr;
    quality::LodConfig last_config_{};
    bool configured_ = false;
    uint64_t trims_scheduled_ = 0;
};

} // namespace mrc::cache
