// Latitude/longitude to globe-local positions
//
// Y-up, right-handed, +Z toward the viewer. Longitude is shifted by the globe
// texture's calibration offset before conversion. Results are expressed in the
// globe model's local (pre-scale) space, so each axis is divided by the model's
// scale.

#pragma once

#include <math/types.hpp>

#include <optional>

namespace atlas::geo {

using namespace math;

struct GlobeConfig {
    float visual_radius = 0.5f;               // Rendered globe radius after model scaling
    double longitude_calibration_deg = 170.0; // Aligns the texture seam with the prime meridian
    float desired_diameter = 1.0f;            // Target size of the reference model
};

// Canonical marker up axis
constexpr vec3 MARKER_UP = {0.0f, 1.0f, 0.0f};

// Surface point on a sphere of `sphere_radius`, in the parent's local space.
// Absent when no reference model (and so no parent scale) is available.
std::optional<vec3> project(double latitude, double longitude, float sphere_radius,
                            const std::optional<vec3>& parent_scale,
                            double longitude_calibration_deg = 170.0);

// Rotation taking MARKER_UP onto the direction from the sphere centre to `point`
quat outward_orientation(const vec3& point);

// Uniform scale making the largest extent of `bounds` equal `desired_diameter`.
// Absent for empty or zero-size bounds.
std::optional<float> fit_scale(const AABB& bounds, float desired_diameter);

// Holds the loaded reference model's scale and projects against it
class GeoProjector {
public:
    explicit GeoProjector(GlobeConfig config = {}) : config_(config) {}

    const GlobeConfig& config() const { return config_; }

    // Reference model loaded with the given (possibly non-uniform) scale
    void set_reference_scale(const vec3& scale) { reference_scale_ = scale; }

    // Reference model loaded with these visual bounds; scales it to the desired
    // diameter, or leaves it unscaled when the bounds are degenerate
    vec3 fit_reference(const AABB& bounds);

    void clear_reference() { reference_scale_.reset(); }
    bool has_reference() const { return reference_scale_.has_value(); }
    const std::optional<vec3>& reference_scale() const { return reference_scale_; }

    std::optional<vec3> project(double latitude, double longitude) const {
        return geo::project(latitude, longitude, config_.visual_radius, reference_scale_,
                            config_.longitude_calibration_deg);
    }

private:
    GlobeConfig config_;
    std::optional<vec3> reference_scale_;
};

} // namespace atlas::geo
