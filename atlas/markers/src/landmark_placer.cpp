#include <markers/landmark_placer.hpp>
#include <core/debug_log.hpp>

namespace atlas::markers {

const char* landmark_name(LandmarkKind kind) {
    switch (kind) {
        case LandmarkKind::Factory:       return "factory";
        case LandmarkKind::PowerLines:    return "power-lines";
        case LandmarkKind::CoolingTowers: return "cooling-towers";
    }
    return "unknown";
}

std::optional<LandmarkKind> parse_landmark(std::string_view text) {
    for (auto kind : {LandmarkKind::Factory, LandmarkKind::PowerLines, LandmarkKind::CoolingTowers}) {
        if (text == landmark_name(kind)) return kind;
    }
    return std::nullopt;
}

std::vector<LandmarkOp> LandmarkPlacer::show(LandmarkKind kind, double latitude, double longitude,
                                             const geo::GeoProjector& projector) {
    auto surface = projector.project(latitude, longitude);
    if (!surface) {
        ATLAS_LOG("Globe not loaded; cannot place %s", landmark_name(kind));
        return {};
    }

    std::vector<LandmarkOp> ops = hide();

    vec3 outward = surface->normalized();
    Landmark landmark{};
    landmark.kind = kind;
    landmark.orientation = geo::outward_orientation(*surface);
    landmark.position = *surface + outward * config_.surface_offset;
    landmark.scale = config_.scale;

    current_ = landmark;
    ops.push_back(LandmarkOp{LandmarkOpType::Create, landmark});
    return ops;
}

std::vector<LandmarkOp> LandmarkPlacer::hide() {
    std::vector<LandmarkOp> ops;
    if (current_) {
        ops.push_back(LandmarkOp{LandmarkOpType::Remove, *current_});
        current_.reset();
    }
    return ops;
}

} // namespace atlas::markers
