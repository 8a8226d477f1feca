// Headless renderer: prints every call on stdout

#include <render/marker_renderer.hpp>
#include <stats/quintile_classifier.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>

namespace atlas::render {

namespace {

std::ostream& operator<<(std::ostream& os, const vec3& v) {
    return os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

class LoggingRenderer : public IMarkerRenderer {
public:
    LoggingRenderer() { std::cout << std::fixed << std::setprecision(4); }

    MarkerHandle create_marker(const std::string& key, const vec3& position,
                               const quat& orientation, int bin) override {
        MarkerHandle handle = next_handle_++;
        keys_[handle] = key;
        std::cout << "  + " << key << " at " << position
                  << " rot (" << orientation.x << ", " << orientation.y << ", "
                  << orientation.z << ", " << orientation.w << ")"
                  << " bin " << bin << " [" << stats::bin_name(bin) << "]" << std::endl;
        return handle;
    }

    void move_marker(MarkerHandle handle, const vec3& position, float duration) override {
        std::cout << "  ~ " << keys_[handle] << " -> " << position
                  << " over " << duration << "s" << std::endl;
    }

    void recolor_marker(MarkerHandle handle, int bin) override {
        std::cout << "    " << keys_[handle] << " bin " << bin
                  << " [" << stats::bin_name(bin) << "]" << std::endl;
    }

    void set_label_visible(MarkerHandle handle, bool visible) override {
        if (visible) std::cout << "    label: " << keys_[handle] << std::endl;
    }

    void set_glow(MarkerHandle handle, bool enabled) override {
        if (enabled) std::cout << "  * glow: " << keys_[handle] << std::endl;
    }

    void remove_marker(MarkerHandle handle) override {
        std::cout << "  - " << keys_[handle] << std::endl;
        keys_.erase(handle);
    }

    LandmarkHandle create_landmark(const markers::Landmark& landmark) override {
        std::cout << "  + landmark " << markers::landmark_name(landmark.kind)
                  << " at " << landmark.position << " scale " << landmark.scale << std::endl;
        return next_handle_++;
    }

    void remove_landmark(LandmarkHandle handle) override {
        std::cout << "  - landmark #" << handle << std::endl;
    }

private:
    MarkerHandle next_handle_ = 1;
    std::unordered_map<MarkerHandle, std::string> keys_;
};

} // namespace

std::unique_ptr<IMarkerRenderer> create_logging_renderer() {
    return std::make_unique<LoggingRenderer>();
}

} // namespace atlas::render
