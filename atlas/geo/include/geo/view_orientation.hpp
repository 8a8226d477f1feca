// Globe rotation that brings a latitude/longitude to face the viewer
//
// Uses negated latitude and unshifted longitude. This differs from marker
// placement (geo_projector.hpp) and matches the globe asset's texture
// orientation; the two conventions are intentionally separate.

#pragma once

#include <math/types.hpp>

namespace atlas::geo {

using namespace math;

constexpr vec3 VIEW_FORWARD = {0.0f, 0.0f, -1.0f};
constexpr vec3 NORTH_POLE = {0.0f, 1.0f, 0.0f};

// Unit vector for the view convention
vec3 view_target_vector(double latitude, double longitude);

// Pure roll (radians, about VIEW_FORWARD) left on north after `rotation`
float residual_roll(const quat& rotation);

// Rotate the target onto VIEW_FORWARD, then remove roll so north stays up
quat solve_orientation(double latitude, double longitude);

} // namespace atlas::geo
