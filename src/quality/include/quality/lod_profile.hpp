#pragma once
#include <array>
#include <limits>

#include "quality/lod_types.hpp"

namespace mrc::quality {

/**
 * @brief FPS thresholds driving the tier state machine
 *
 * drop_fps[m]: below this the controller steps down from m.
 * raise_fps[m]: above this the controller steps up from m.
 * Low has no drop threshold and High has no raise threshold.
 */
struct LodThresholds {
    static constexpr double kNever = std::numeric_limits<double>::infinity();

    std::array<double, kLodModeCount> drop_fps{50.0, 45.0, -kNever};
    std::array<double, kLodModeCount> raise_fps{kNever, 58.0, 60.0};
    double grace_period_ms = 3000.0;

    double drop_threshold(LodMode m) const noexcept { return drop_fps[lod_index(m)]; }
    double raise_threshold(LodMode m) const noexcept { return raise_fps[lod_index(m)]; }
};

struct LodProfile {
    LodThresholds thresholds;
    std::array<LodConfig, kLodModeCount> configs{};

    const LodConfig& config(LodMode m) const noexcept { return configs[lod_index(m)]; }
    LodConfig& config(LodMode m) noexcept { return configs[lod_index(m)]; }

    // Typical devices.
    static LodProfile standard();
    // Weak GPUs: drops earlier, caps harder, throttles longer.
    static LodProfile low_end();
    // Strong devices: shows more, still drops quickly when frames slip.
    static LodProfile high_end();
};

// Repairs values a controller cannot run with (inverted dead-zone, negative
// grace period or capacities, negative intervals). Every repair is logged.
// Returns the number of fields changed.
int sanitize(LodProfile& profile);

} // namespace mrc::quality
