#include "quality/lod_profile.hpp"
#include "core/log.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace mrc::quality {

namespace {

constexpr int64_t kMiB = 1024LL * 1024;
constexpr int64_t kMinPoolEntries = 1;
constexpr int64_t kMinPoolBytes = 1024;

LodProfile make_profile(double drop_fps, double raise_fps, size_t cap_medium, size_t cap_low,
                        double eps_medium, double eps_low, double throttle_low_ms) {
    LodProfile p;
    // Medium drops 5 fps lower than High, Low needs 2 fps more than Medium to
    // recover, which widens the dead-zone around the cheaper tiers.
    p.thresholds.drop_fps = {drop_fps, drop_fps - 5.0, -LodThresholds::kNever};
    p.thresholds.raise_fps = {LodThresholds::kNever, raise_fps, raise_fps + 2.0};
    p.thresholds.grace_period_ms = 3000.0;

    auto& high = p.config(LodMode::High);
    high.entity_cap = LodConfig::kUnboundedCap;
    high.simplification_epsilon = 0.0;
    high.pool_capacity_entries = 100;
    high.pool_capacity_bytes = 30 * kMiB;
    high.update_throttle_ms = 0.0;

    auto& medium = p.config(LodMode::Medium);
    medium.entity_cap = cap_medium;
    medium.simplification_epsilon = eps_medium;
    medium.pool_capacity_entries = 50;
    medium.pool_capacity_bytes = 20 * kMiB;
    medium.update_throttle_ms = 30.0;

    auto& low = p.config(LodMode::Low);
    low.entity_cap = cap_low;
    low.simplification_epsilon = eps_low;
    low.pool_capacity_entries = 30;
    low.pool_capacity_bytes = 10 * kMiB;
    low.update_throttle_ms = throttle_low_ms;
    return p;
}

} // namespace

const char* to_string(LodMode m) noexcept {
    switch(m) {
        case LodMode::High: return "High";
        case LodMode::Medium: return "Medium";
        case LodMode::Low: return "Low";
    }
    return "Unknown";
}

const char* describe(LodMode m) noexcept {
    switch(m) {
        case LodMode::High: return "High Quality (Full Detail)";
        case LodMode::Medium: return "Medium Quality (Balanced)";
        case LodMode::Low: return "Low Quality (Performance)";
    }
    return "Unknown";
}

LodProfile LodProfile::standard() { return make_profile(50.0, 58.0, 900, 400, 1.5, 3.0, 150.0); }
LodProfile LodProfile::low_end() { return make_profile(45.0, 55.0, 600, 250, 2.5, 5.0, 250.0); }
LodProfile LodProfile::high_end() { return make_profile(55.0, 58.0, 1200, 600, 1.0, 2.0, 100.0); }

int sanitize(LodProfile& profile) {
    int repairs = 0;
    auto& th = profile.thresholds;

    if(!(th.grace_period_ms >= 0.0)) {
        log::warn("[LodProfile] grace_period_ms invalid, clamped to 0");
        th.grace_period_ms = 0.0;
        ++repairs;
    }

    for(LodMode m : kAllLodModes) {
        const size_t i = lod_index(m);
        if(std::isnan(th.drop_fps[i])) {
            log::warn(std::string("[LodProfile] drop threshold for ") + to_string(m) + " is NaN, disabled");
            th.drop_fps[i] = -LodThresholds::kNever;
            ++repairs;
        }
        if(std::isnan(th.raise_fps[i])) {
            log::warn(std::string("[LodProfile] raise threshold for ") + to_string(m) + " is NaN, disabled");
            th.raise_fps[i] = LodThresholds::kNever;
            ++repairs;
        }

        auto& cfg = profile.configs[i];
        if(cfg.pool_capacity_entries < kMinPoolEntries) {
            log::warn(std::string("[LodProfile] ") + to_string(m) + " pool_capacity_entries " +
                      std::to_string(cfg.pool_capacity_entries) + " clamped to " + std::to_string(kMinPoolEntries));
            cfg.pool_capacity_entries = kMinPoolEntries;
            ++repairs;
        }
        if(cfg.pool_capacity_bytes < kMinPoolBytes) {
            log::warn(std::string("[LodProfile] ") + to_string(m) + " pool_capacity_bytes " +
                      std::to_string(cfg.pool_capacity_bytes) + " clamped to " + std::to_string(kMinPoolBytes));
            cfg.pool_capacity_bytes = kMinPoolBytes;
            ++repairs;
        }
        if(!(cfg.update_throttle_ms >= 0.0)) {
            log::warn(std::string("[LodProfile] ") + to_string(m) + " update_throttle_ms invalid, clamped to 0");
            cfg.update_throttle_ms = 0.0;
            ++repairs;
        }
        if(!(cfg.simplification_epsilon >= 0.0)) {
            log::warn(std::string("[LodProfile] ") + to_string(m) + " simplification_epsilon invalid, clamped to 0");
            cfg.simplification_epsilon = 0.0;
            ++repairs;
        }
    }

    // A tier's drop threshold stays below the raise threshold of the tier it drops to.
    const std::pair<LodMode, LodMode> steps[] = {{LodMode::High, LodMode::Medium}, {LodMode::Medium, LodMode::Low}};
    for(const auto& [richer, cheaper] : steps) {
        const double drop = th.drop_threshold(richer);
        double& raise = th.raise_fps[lod_index(cheaper)];
        if(std::isfinite(drop) && std::isfinite(raise) && !(drop < raise)) {
            log::warn(std::string("[LodProfile] dead-zone inverted: ") + to_string(richer) + " drops below " +
                      std::to_string(drop) + " but " + to_string(cheaper) + " raises above " + std::to_string(raise) +
                      ", raise moved to " + std::to_string(drop + 1.0));
            raise = drop + 1.0;
            ++repairs;
        }
    }
    return repairs;
}

} // namespace mrc::quality
