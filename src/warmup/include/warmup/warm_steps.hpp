#pragma once
#include <vector>

#include "warmup/startup_warm_cycle.hpp"
#include "warmup/tile_math.hpp"

namespace mrc::quality { class AdaptiveLodController; }
namespace mrc::cache { class ResourcePoolManager; }

namespace mrc::warmup {

// Host hooks for the asset side of warm-up.
class IAssetWarmer {
public:
    virtual ~IAssetWarmer() = default;
    // Marker bitmaps, icons and other visuals that do not depend on entities.
    virtual void prebuild_fixed_assets() = 0;
    // Selected/highlighted variants of the fixed assets.
    virtual void prebuild_selection_variants() = 0;
    virtual void prefetch_tile(const TileCoord& tile) = 0;
};

inline constexpr int kWarmTileRadius = 1;

// Four steps: fixed assets, selection variants, pool sizing for the current
// tier, and the 3x3 tile ring around the start center. Individual tile
// failures are logged and skipped.
std::vector<WarmStep> standard_warm_steps(IAssetWarmer& warmer, quality::AdaptiveLodController& controller,
                                          cache::ResourcePoolManager& pools);

} // namespace mrc::warmup
