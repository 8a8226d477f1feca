#pragma once

#include <cmath>

namespace atlas::math {

constexpr float PI = 3.14159265358979323846f;
constexpr double PI_D = 3.14159265358979323846;

// Geographic inputs arrive as doubles; convert before narrowing to float
inline float radians_from_degrees(double degrees) {
    return static_cast<float>(degrees * PI_D / 180.0);
}

// Globe-local position or direction (Y-up, +Z toward the viewer)
struct vec3 {
    float x, y, z;

    constexpr vec3() : x(0), y(0), z(0) {}
    constexpr vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
    constexpr explicit vec3(float s) : x(s), y(s), z(s) {}

    vec3 operator+(const vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    vec3 operator-(const vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    vec3 operator/(float s) const { return {x / s, y / s, z / s}; }
    vec3 operator-() const { return {-x, -y, -z}; }

    // Per-axis division, used to undo a parent node's scale
    vec3 divided_by(const vec3& o) const { return {x / o.x, y / o.y, z / o.z}; }

    float dot(const vec3& o) const { return x * o.x + y * o.y + z * o.z; }
    vec3 cross(const vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    float length_sq() const { return dot(*this); }
    float length() const { return std::sqrt(length_sq()); }
    vec3 normalized() const {
        float l = length();
        return l > 0 ? *this / l : vec3(0);
    }

    float max_component() const { return std::fmax(x, std::fmax(y, z)); }
};

// RGBA colour, components in [0, 1]
struct vec4 {
    float x, y, z, w;

    constexpr vec4() : x(0), y(0), z(0), w(0) {}
    constexpr vec4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}
};

// Unit quaternion rotation. a * b applies b first.
struct quat {
    float x, y, z, w;

    quat() : x(0), y(0), z(0), w(1) {}
    quat(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    static quat from_axis_angle(const vec3& axis, float radians) {
        vec3 a = axis.normalized() * std::sin(radians * 0.5f);
        return {a.x, a.y, a.z, std::cos(radians * 0.5f)};
    }

    // Shortest arc taking direction `from` onto direction `to`.
    // Opposite directions turn half a revolution about from x +X
    // (from x +Y when `from` lies on the X axis).
    static quat from_to(const vec3& from, const vec3& to) {
        vec3 a = from.normalized();
        vec3 b = to.normalized();
        float d = a.dot(b);

        if (d >= 1.0f - 1e-6f) {
            return quat{};
        }
        if (d <= -1.0f + 1e-6f) {
            vec3 axis = a.cross(vec3(1, 0, 0));
            if (axis.length_sq() < 1e-8f) {
                axis = a.cross(vec3(0, 1, 0));
            }
            return from_axis_angle(axis, PI);
        }

        vec3 c = a.cross(b);
        return quat{c.x, c.y, c.z, 1.0f + d}.normalized();
    }

    vec3 vector_part() const { return {x, y, z}; }

    quat operator*(const quat& o) const {
        vec3 u = vector_part();
        vec3 v = o.vector_part();
        vec3 r = v * w + u * o.w + u.cross(v);
        return {r.x, r.y, r.z, w * o.w - u.dot(v)};
    }

    float length() const { return std::sqrt(x * x + y * y + z * z + w * w); }

    quat normalized() const {
        float l = length();
        return l > 0 ? quat{x / l, y / l, z / l, w / l} : quat{};
    }

    // v' = v + 2w(u x v) + 2u x (u x v)
    vec3 rotate(const vec3& v) const {
        vec3 u = vector_part();
        vec3 t = u.cross(v) * 2.0f;
        return v + t * w + u.cross(t);
    }
};

// Model bounds; default-constructed bounds are empty (min > max)
struct AABB {
    vec3 min, max;

    AABB() : min(INFINITY), max(-INFINITY) {}
    AABB(const vec3& min_, const vec3& max_) : min(min_), max(max_) {}

    vec3 size() const { return max - min; }

    bool valid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }
};

} // namespace atlas::math
