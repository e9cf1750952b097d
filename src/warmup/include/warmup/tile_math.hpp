#pragma once
#include <vector>

namespace mrc::warmup {

struct TileCoord {
    int x = 0;
    int y = 0;
    int z = 0;
    bool operator==(const TileCoord& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const TileCoord& o) const { return !(*this == o); }
};

inline constexpr int kMaxTileZoom = 22;
// Web Mercator is undefined past this latitude.
inline constexpr double kMaxMercatorLat = 85.0511287798066;

// Slippy-map tile containing the point. Zoom is floored and clamped to
// [0, kMaxTileZoom]; longitude wraps, latitude clamps to the Mercator range.
TileCoord tile_for(double lat, double lon, double zoom);

// Tiles within `radius` of the center (a (2r+1)^2 square), row-major from the
// top-left. Columns wrap around the antimeridian; rows past the poles are
// dropped; duplicates at low zoom are removed.
std::vector<TileCoord> tile_ring(const TileCoord& center, int radius);

} // namespace mrc::warmup
