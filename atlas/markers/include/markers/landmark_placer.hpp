// Single-slot landmark (factory, power lines, cooling towers) on the globe surface

#pragma once

#include <geo/geo_projector.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace atlas::markers {

using namespace math;

enum class LandmarkKind : uint8_t {
    Factory,
    PowerLines,
    CoolingTowers
};

const char* landmark_name(LandmarkKind kind);
std::optional<LandmarkKind> parse_landmark(std::string_view text);

struct LandmarkConfig {
    float surface_offset = 0.002f;   // Lift along the outward normal to avoid z-fighting
    float scale = 0.1f;              // Uniform model scale
};

struct Landmark {
    LandmarkKind kind;
    vec3 position;
    quat orientation;
    float scale;
};

enum class LandmarkOpType : uint8_t { Create, Remove };

struct LandmarkOp {
    LandmarkOpType type;
    Landmark landmark;   // The created landmark, or the one being removed
};

class LandmarkPlacer {
public:
    explicit LandmarkPlacer(LandmarkConfig config = {}) : config_(config) {}

    // Replaces any current landmark. Empty when the globe is not loaded.
    std::vector<LandmarkOp> show(LandmarkKind kind, double latitude, double longitude,
                                 const geo::GeoProjector& projector);

    std::vector<LandmarkOp> hide();

    const std::optional<Landmark>& current() const { return current_; }

private:
    LandmarkConfig config_;
    std::optional<Landmark> current_;
};

} // namespace atlas::markers
