// Abstract rendering collaborator for globe markers and landmarks
// Implementations wrap a scene-graph engine; the core only emits calls

#pragma once

#include <markers/landmark_placer.hpp>
#include <math/types.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace atlas::render {

using namespace math;

using MarkerHandle = uint64_t;
using LandmarkHandle = uint64_t;

class IMarkerRenderer {
public:
    virtual ~IMarkerRenderer() = default;

    // Instantiate a marker from the prototype; colour from the quintile bin
    virtual MarkerHandle create_marker(const std::string& key, const vec3& position,
                                       const quat& orientation, int bin) = 0;

    // Animate to a new globe-local position
    virtual void move_marker(MarkerHandle handle, const vec3& position, float duration) = 0;

    virtual void recolor_marker(MarkerHandle handle, int bin) = 0;

    // Floating country-name label
    virtual void set_label_visible(MarkerHandle handle, bool visible) = 0;

    // Looping glow animation
    virtual void set_glow(MarkerHandle handle, bool enabled) = 0;

    virtual void remove_marker(MarkerHandle handle) = 0;

    virtual LandmarkHandle create_landmark(const markers::Landmark& landmark) = 0;
    virtual void remove_landmark(LandmarkHandle handle) = 0;
};

// Renderer that only logs what it is asked to do (headless runs)
std::unique_ptr<IMarkerRenderer> create_logging_renderer();

} // namespace atlas::render
