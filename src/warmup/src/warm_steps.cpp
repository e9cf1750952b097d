#include "warmup/warm_steps.hpp"
#include "cache/resource_pool_manager.hpp"
#include "core/log.hpp"
#include "quality/adaptive_lod_controller.hpp"

namespace mrc::warmup {

std::vector<WarmStep> standard_warm_steps(IAssetWarmer& warmer, quality::AdaptiveLodController& controller,
                                          cache::ResourcePoolManager& pools) {
    std::vector<WarmStep> steps;
    steps.push_back({"fixed_assets", [&warmer](const WarmContext&) { warmer.prebuild_fixed_assets(); }});
    steps.push_back({"selection_variants", [&warmer](const WarmContext&) { warmer.prebuild_selection_variants(); }});
    steps.push_back({"pool_capacities", [&controller, &pools](const WarmContext&) {
        pools.apply_lod(controller.mode(), controller.config());
    }});
    steps.push_back({"tile_ring", [&warmer](const WarmContext& ctx) {
        const TileCoord center = tile_for(ctx.center.lat, ctx.center.lon, ctx.zoom);
        const auto tiles = tile_ring(center, kWarmTileRadius);
        size_t fetched = 0;
        for(const auto& t : tiles) {
            try {
                warmer.prefetch_tile(t);
                ++fetched;
            } catch(const std::exception& e) {
                log::debug("[Warmup] tile " + std::to_string(t.z) + "/" + std::to_string(t.x) + "/" +
                           std::to_string(t.y) + " skipped: " + e.what());
            }
        }
        log::debug("[Warmup] prefetched " + std::to_string(fetched) + "/" + std::to_string(tiles.size()) +
                   " tiles at zoom " + std::to_string(center.z));
    }});
    return steps;
}

} // namespace mrc::warmup
