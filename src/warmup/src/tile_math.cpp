#include "warmup/tile_math.hpp"

#include <algorithm>
#include <cmath>

namespace mrc::warmup {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

TileCoord tile_for(double lat, double lon, double zoom) {
    int z = std::isfinite(zoom) ? static_cast<int>(std::floor(zoom)) : 0;
    z = std::clamp(z, 0, kMaxTileZoom);
    const long long n = 1LL << z;

    if(!std::isfinite(lat)) lat = 0.0;
    if(!std::isfinite(lon)) lon = 0.0;
    lat = std::clamp(lat, -kMaxMercatorLat, kMaxMercatorLat);

    long long x = static_cast<long long>(std::floor((lon + 180.0) / 360.0 * double(n)));
    x = ((x % n) + n) % n;

    const double lat_rad = lat * kPi / 180.0;
    const double merc = std::log(std::tan(lat_rad) + 1.0 / std::cos(lat_rad));
    long long y = static_cast<long long>(std::floor((1.0 - merc / kPi) / 2.0 * double(n)));
    y = std::clamp(y, 0LL, n - 1);

    return TileCoord{static_cast<int>(x), static_cast<int>(y), z};
}

std::vector<TileCoord> tile_ring(const TileCoord& center, int radius) {
    radius = std::max(radius, 0);
    const long long n = 1LL << std::clamp(center.z, 0, kMaxTileZoom);
    std::vector<TileCoord> out;
    for(int dy = -radius; dy <= radius; ++dy) {
        const long long y = static_cast<long long>(center.y) + dy;
        if(y < 0 || y >= n) continue;
        for(int dx = -radius; dx <= radius; ++dx) {
            const long long x = ((static_cast<long long>(center.x) + dx) % n + n) % n;
            TileCoord t{static_cast<int>(x), static_cast<int>(y), center.z};
            if(std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
        }
    }
    return out;
}

} // namespace mrc::warmup
