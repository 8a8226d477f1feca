#include <geo/view_orientation.hpp>

#include <cmath>

namespace atlas::geo {

vec3 view_target_vector(double latitude, double longitude) {
    float lat = radians_from_degrees(-latitude);
    float lon = radians_from_degrees(longitude);
    return vec3(std::cos(lat) * std::sin(lon),
                std::sin(lat),
                std::cos(lat) * std::cos(lon)).normalized();
}

float residual_roll(const quat& rotation) {
    vec3 north_after = rotation.rotate(NORTH_POLE);
    return std::atan2(north_after.x, north_after.y);
}

quat solve_orientation(double latitude, double longitude) {
    vec3 target = view_target_vector(latitude, longitude);

    // A from/to rotation leaves roll about the target axis free
    quat q1 = quat::from_to(target, VIEW_FORWARD);

    float roll = residual_roll(q1);
    quat correction = quat::from_axis_angle(VIEW_FORWARD, -roll);

    return (correction * q1).normalized();
}

} // namespace atlas::geo
