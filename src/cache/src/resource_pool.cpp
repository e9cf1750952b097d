#include "cache/resource_pool.hpp"

#include <cstdio>

namespace mrc::cache {

PoolLimits clamp_limits(const std::string& pool_name, int64_t max_entries, int64_t max_bytes) {
    PoolLimits out{max_entries, max_bytes};
    if(out.max_entries < kMinPoolEntries) {
        log::warn("[ResourcePool] " + pool_name + " max_entries " + std::to_string(max_entries) +
                  " clamped to " + std::to_string(kMinPoolEntries));
        out.max_entries = kMinPoolEntries;
    }
    if(out.max_bytes < kMinPoolBytes) {
        log::warn("[ResourcePool] " + pool_name + " max_bytes " + std::to_string(max_bytes) +
                  " clamped to " + std::to_string(kMinPoolBytes));
        out.max_bytes = kMinPoolBytes;
    }
    return out;
}

std::string format_bytes(int64_t bytes) {
    char buf[32];
    if(bytes < 1024) std::snprintf(buf, sizeof(buf), "%lldB", static_cast<long long>(bytes));
    else if(bytes < 1024 * 1024) std::snprintf(buf, sizeof(buf), "%.1fKB", double(bytes) / 1024.0);
    else std::snprintf(buf, sizeof(buf), "%.1fMB", double(bytes) / (1024.0 * 1024.0));
    return buf;
}

std::string to_string(const PoolStats& st) {
    char rate[16];
    std::snprintf(rate, sizeof(rate), "%.1f%%", st.hit_rate() * 100.0);
    return st.name + ": " + std::to_string(st.entries) + "/" + std::to_string(st.max_entries) + " entries, " +
           format_bytes(st.bytes) + "/" + format_bytes(st.max_bytes) + ", hit " + rate +
           " (" + std::to_string(st.hits) + " hits, " + std::to_string(st.misses) + " misses, " +
           std::to_string(st.evictions) + " evictions)";
}

} // namespace mrc::cache
