#pragma once
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/log.hpp"

namespace mrc::cache {

struct PoolLimits {
    int64_t max_entries = 0;
    int64_t max_bytes = 0;
};

// Smallest limits a pool accepts; anything below is clamped and logged.
inline constexpr int64_t kMinPoolEntries = 1;
inline constexpr int64_t kMinPoolBytes = 1024;

PoolLimits clamp_limits(const std::string& pool_name, int64_t max_entries, int64_t max_bytes);

struct PoolStats {
    std::string name;
    size_t entries = 0;
    int64_t bytes = 0;
    int64_t max_entries = 0;
    int64_t max_bytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t rejected = 0;
    double hit_rate() const { return (hits + misses) ? double(hits) / double(hits + misses) : 0.0; }
};

std::string format_bytes(int64_t bytes);
std::string to_string(const PoolStats& st);

// Type-erased view used by the manager and idle maintenance.
class IResourcePool {
public:
    virtual ~IResourcePool() = default;
    virtual const std::string& name() const = 0;
    // Records new limits. Usage above them is evicted by the next put() or trim().
    virtual void configure(int64_t max_entries, int64_t max_bytes) = 0;
    // Evicts least-recently-used entries until within limits; returns the count.
    virtual size_t trim() = 0;
    virtual bool over_capacity() const = 0;
    virtual PoolStats stats() const = 0;
    virtual void clear() = 0;
};

/**
 * @brief Bounded LRU store of expensive-to-build objects
 *
 * Entry count and summed byte size both stay within the configured limits
 * after every put() and trim(), whatever the insertion order.
 */
template <class T>
class ResourcePool final : public IResourcePool {
public:
    using Ptr = std::shared_ptr<T>;
    using Loader = std::function<std::pair<Ptr, int64_t>()>;
    using EvictionCallback = std::function<void(const std::string& key, const Ptr& resource)>;

    ResourcePool(std::string name, int64_t max_entries, int64_t max_bytes)
        : name_(std::move(name)), limits_(clamp_limits(name_, max_entries, max_bytes)) {}

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    const std::string& name() const override { return name_; }

    // Returns nullptr on miss. A hit makes the entry most recently used.
    Ptr get(const std::string& key) {
        auto it = map_.find(key);
        if(it == map_.end()) { ++misses_; return nullptr; }
        ++hits_;
        lru_.splice(lru_.begin(), lru_, it->second.it);
        it->second.last_access = ++access_tick_;
        return it->second.resource;
    }

    bool contains(const std::string& key) const { return map_.count(key) != 0; }

    /**
     * @brief Insert or replace an entry
     * @return false if the resource alone exceeds max_bytes (pool unchanged)
     * @throws std::invalid_argument on a null resource or negative size
     */
    bool put(const std::string& key, Ptr resource, int64_t size_bytes) {
        if(!resource) throw std::invalid_argument("ResourcePool::put requires a resource");
        if(size_bytes < 0) throw std::invalid_argument("ResourcePool::put requires a non-negative size");
        if(size_bytes > limits_.max_bytes) {
            ++rejected_;
            log::warn("[ResourcePool] " + name_ + " rejected '" + key + "' (" + format_bytes(size_bytes) +
                      " > max " + format_bytes(limits_.max_bytes) + ")");
            return false;
        }

        auto it = map_.find(key);
        if(it != map_.end()) {
            bytes_ += size_bytes - it->second.size_bytes;
            Ptr previous = std::move(it->second.resource);
            it->second.resource = std::move(resource);
            it->second.size_bytes = size_bytes;
            it->second.last_access = ++access_tick_;
            lru_.splice(lru_.begin(), lru_, it->second.it);
            if(on_evict_ && previous != it->second.resource) on_evict_(key, previous);
        } else {
            lru_.push_front(key);
            map_.emplace(key, Entry{std::move(resource), size_bytes, ++access_tick_, lru_.begin()});
            bytes_ += size_bytes;
        }
        evict_to_limits();
        return true;
    }

    // Cache-through lookup. Loader returns {resource, size}; a null resource is
    // passed through uncached.
    Ptr get_or_create(const std::string& key, const Loader& loader) {
        if(Ptr hit = get(key)) return hit;
        auto [resource, size] = loader();
        if(!resource) {
            log::warn("[ResourcePool] " + name_ + " loader produced nothing for '" + key + "'");
            return nullptr;
        }
        Ptr out = resource;
        put(key, std::move(resource), size);
        return out;
    }

    bool remove(const std::string& key) {
        auto it = map_.find(key);
        if(it == map_.end()) return false;
        release(it);
        return true;
    }

    void configure(int64_t max_entries, int64_t max_bytes) override {
        limits_ = clamp_limits(name_, max_entries, max_bytes);
        log::debug("[ResourcePool] " + name_ + " configured: " + std::to_string(limits_.max_entries) + " entries, " +
                   format_bytes(limits_.max_bytes) + (over_capacity() ? " (over capacity until next trim)" : ""));
    }

    size_t trim() override { return evict_to_limits(); }

    bool over_capacity() const override {
        return static_cast<int64_t>(map_.size()) > limits_.max_entries || bytes_ > limits_.max_bytes;
    }

    void clear() override {
        while(!lru_.empty()) release(map_.find(lru_.back()));
    }

    PoolStats stats() const override {
        PoolStats st;
        st.name = name_;
        st.entries = map_.size();
        st.bytes = bytes_;
        st.max_entries = limits_.max_entries;
        st.max_bytes = limits_.max_bytes;
        st.hits = hits_;
        st.misses = misses_;
        st.evictions = evictions_;
        st.rejected = rejected_;
        return st;
    }

    // Called whenever an entry leaves the pool (eviction, remove, replace, clear).
    void set_eviction_callback(EvictionCallback cb) { on_evict_ = std::move(cb); }

    size_t size() const { return map_.size(); }
    int64_t bytes() const { return bytes_; }
    const PoolLimits& limits() const { return limits_; }
    // Access tick of an entry (0 if absent); larger means more recent.
    uint64_t last_access(const std::string& key) const {
        auto it = map_.find(key);
        return it == map_.end() ? 0 : it->second.last_access;
    }

private:
    struct Entry {
        Ptr resource;
        int64_t size_bytes = 0;
        uint64_t last_access = 0;
        std::list<std::string>::iterator it;
    };
    using Map = std::unordered_map<std::string, Entry>;

    size_t evict_to_limits() {
        size_t evicted = 0;
        while(over_capacity() && !lru_.empty()) {
            auto victim = map_.find(lru_.back());
            log::trace("[ResourcePool] " + name_ + " evicted '" + victim->first + "' (" +
                       format_bytes(victim->second.size_bytes) + ")");
            release(victim);
            ++evictions_;
            ++evicted;
        }
        return evicted;
    }

    void release(typename Map::iterator it) {
        Ptr resource = std::move(it->second.resource);
        std::string key = it->first;
        bytes_ -= it->second.size_bytes;
        lru_.erase(it->second.it);
        map_.erase(it);
        if(on_evict_) on_evict_(key, resource);
    }

    std::string name_;
    PoolLimits limits_;
    std::list<std::string> lru_; // front = most recently used
    Map map_;
    int64_t bytes_ = 0;
    uint64_t access_tick_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t rejected_ = 0;
    EvictionCallback on_evict_;
};

} // namespace mrc::cache
