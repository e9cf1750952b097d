#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace mrc::quality {

// Ordered from best fidelity to cheapest.
enum class LodMode : uint8_t { High = 0, Medium = 1, Low = 2 };

inline constexpr size_t kLodModeCount = 3;

constexpr size_t lod_index(LodMode m) noexcept { return static_cast<size_t>(m); }

inline constexpr std::array<LodMode, kLodModeCount> kAllLodModes{LodMode::High, LodMode::Medium, LodMode::Low};

const char* to_string(LodMode m) noexcept;
const char* describe(LodMode m) noexcept;

// Per-tier knobs handed to everything that builds or stores visual objects.
struct LodConfig {
    static constexpr size_t kUnboundedCap = std::numeric_limits<size_t>::max();

    size_t entity_cap = kUnboundedCap;
    double simplification_epsilon = 0.0;   // polyline simplification tolerance for the geometry builder
    int64_t pool_capacity_entries = 100;
    int64_t pool_capacity_bytes = 30LL * 1024 * 1024;
    double update_throttle_ms = 0.0;       // 0 = unthrottled

    bool unbounded() const noexcept { return entity_cap == kUnboundedCap; }
};

/**
 * @brief Anything reconfigured when the quality tier changes
 *
 * Implemented by the pool manager, update throttles and the entity cache.
 * Called synchronously from the controller on every confirmed transition.
 */
class ILodConsumer {
public:
    virtual ~ILodConsumer() = default;
    virtual void apply_lod(LodMode mode, const LodConfig& config) = 0;
};

} // namespace mrc::quality
