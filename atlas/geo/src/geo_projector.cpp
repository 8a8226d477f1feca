#include <geo/geo_projector.hpp>
#include <core/debug_log.hpp>

namespace atlas::geo {

std::optional<vec3> project(double latitude, double longitude, float sphere_radius,
                            const std::optional<vec3>& parent_scale,
                            double longitude_calibration_deg) {
    if (!parent_scale) {
        return std::nullopt;
    }

    float lat = radians_from_degrees(latitude);
    float lon = radians_from_degrees(longitude - longitude_calibration_deg);

    vec3 visual(sphere_radius * std::cos(lat) * std::sin(lon),
                sphere_radius * std::sin(lat),
                sphere_radius * std::cos(lat) * std::cos(lon));

    // Child of a scaled parent: pre-divide so the parent's scale lands it on the surface
    return visual.divided_by(*parent_scale);
}

quat outward_orientation(const vec3& point) {
    return quat::from_to(MARKER_UP, point.normalized());
}

std::optional<float> fit_scale(const AABB& bounds, float desired_diameter) {
    if (!bounds.valid()) {
        return std::nullopt;
    }
    float current = bounds.size().max_component();
    if (current <= 0.0f) {
        return std::nullopt;
    }
    return desired_diameter / current;
}

vec3 GeoProjector::fit_reference(const AABB& bounds) {
    vec3 scale(1.0f);
    if (auto factor = fit_scale(bounds, config_.desired_diameter)) {
        scale = vec3(*factor);
        ATLAS_LOG("Scaled reference model by %f", *factor);
    } else {
        ATLAS_LOG("Could not determine reference model diameter; keeping unit scale");
    }
    reference_scale_ = scale;
    return scale;
}

} // namespace atlas::geo
