#include "cache/resource_pool_manager.hpp"
#include "core/log.hpp"
#include "scheduling/idle_task_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mrc::cache {

namespace {

int64_t scaled(int64_t budget, double share, int64_t floor_value) {
    const double v = std::floor(double(budget) * share);
    return std::max(floor_value, static_cast<int64_t>(v));
}

} // namespace

void ResourcePoolManager::register_pool(IResourcePool& pool, double share) {
    if(!(share > 0.0)) throw std::invalid_argument("ResourcePoolManager::register_pool requires a positive share");
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Registered& r) { return r.pool == &pool; });
    if(it != entries_.end()) {
        it->share = share;
    } else {
        entries_.push_back(Registered{&pool, share});
        it = entries_.end() - 1;
    }
    log::debug("[PoolManager] registered " + pool.name());
    if(configured_) configure(*it, last_config_);
}

bool ResourcePoolManager::unregister_pool(const IResourcePool& pool) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Registered& r) { return r.pool == &pool; });
    if(it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

IResourcePool* ResourcePoolManager::find(const std::string& name) const {
    for(const auto& r : entries_) {
        if(r.pool->name() == name) return r.pool;
    }
    return nullptr;
}

std::vector<IResourcePool*> ResourcePoolManager::pools() const {
    std::vector<IResourcePool*> out;
    out.reserve(entries_.size());
    for(const auto& r : entries_) out.push_back(r.pool);
    return out;
}

void ResourcePoolManager::apply_lod(quality::LodMode mode, const quality::LodConfig& config) {
    last_config_ = config;
    configured_ = true;
    for(auto& r : entries_) configure(r, config);
    log::debug(std::string("[PoolManager] ") + std::to_string(entries_.size()) + " pools sized for " +
               quality::to_string(mode));
}

void ResourcePoolManager::configure(Registered& r, const quality::LodConfig& config) {
    IResourcePool& pool = *r.pool;
    pool.configure(scaled(config.pool_capacity_entries, r.share, kMinPoolEntries),
                   scaled(config.pool_capacity_bytes, r.share, kMinPoolBytes));
    if(!pool.over_capacity()) return;

    if(!idle_ || idle_->is_shut_down()) {
        pool.trim();
        return;
    }
    // The registry may change before the slot runs, so look the pool up again.
    const std::string name = pool.name();
    idle_->schedule_task(
        [this, name] {
            if(IResourcePool* p = find(name)) p->trim();
        },
        scheduling::IdleTaskPriority::High, "trim:" + name);
    ++trims_scheduled_;
}

size_t ResourcePoolManager::trim_all() {
    size_t evicted = 0;
    for(auto& r : entries_) evicted += r.pool->trim();
    return evicted;
}

std::vector<PoolStats> ResourcePoolManager::stats() const {
    std::vector<PoolStats> out;
    out.reserve(entries_.size());
    for(const auto& r : entries_) out.push_back(r.pool->stats());
    return out;
}

double ResourcePoolManager::hit_rate() const {
    uint64_t hits = 0, lookups = 0;
    for(const auto& r : entries_) {
        const PoolStats st = r.pool->stats();
        hits += st.hits;
        lookups += st.hits + st.misses;
    }
    return lookups ? double(hits) / double(lookups) : 0.0;
}

} // namespace mrc::cache
