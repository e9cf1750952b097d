#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

#include "core/expected.hpp"
#include "quality/lod_types.hpp"

namespace mrc::cache {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

// Discrete fields that change how an entity is drawn (status, heading bucket,
// label text). Compared by value between batches.
using StateValue = std::variant<int64_t, double, bool, std::string>;
using StateFields = std::map<std::string, StateValue>;

struct EntityUpdate {
    std::string id;
    GeoPoint position;
    StateFields state;
};

enum class UpdateError : uint8_t { EmptyId, NonFinitePosition, LatitudeOutOfRange, LongitudeOutOfRange };

const char* to_string(UpdateError e) noexcept;

// Checks id and coordinates; returns the position on success.
expected<GeoPoint, UpdateError> validate_update(const EntityUpdate& update);

// Opaque renderable built by the host (marker, label, polyline...).
class VisualObject {
public:
    virtual ~VisualObject() = default;
};

struct BuildContext {
    bool selected = false;
    quality::LodMode mode = quality::LodMode::High;
    double simplification_epsilon = 0.0;
};

// Host hook that turns entity state into visual objects.
class IVisualFactory {
public:
    virtual ~IVisualFactory() = default;
    virtual std::shared_ptr<VisualObject> build(const EntityUpdate& update, const BuildContext& ctx) = 0;
    // Called once when an object is replaced or its entity leaves the cache.
    virtual void dispose(const VisualObject& object) = 0;
};

enum class ChangeFlags : uint8_t { None = 0, Position = 1 << 0, State = 1 << 1, Selection = 1 << 2 };

constexpr ChangeFlags operator|(ChangeFlags a, ChangeFlags b) noexcept {
    return static_cast<ChangeFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
constexpr ChangeFlags operator&(ChangeFlags a, ChangeFlags b) noexcept {
    return static_cast<ChangeFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline ChangeFlags& operator|=(ChangeFlags& a, ChangeFlags b) noexcept { return a = a | b; }
constexpr bool has_flag(ChangeFlags set, ChangeFlags f) noexcept { return (set & f) != ChangeFlags::None; }

std::string to_string(ChangeFlags f);

} // namespace mrc::cache
