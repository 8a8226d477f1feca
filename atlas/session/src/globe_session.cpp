#include <session/globe_session.hpp>
#include <core/debug_log.hpp>

namespace atlas::session {

GlobeSession::GlobeSession(data::EnergyDataset& dataset,
                           const data::IHistorySource& history,
                           render::IMarkerRenderer& renderer,
                           SessionConfig config)
    : dataset_(&dataset),
      config_(config),
      metric_(config.initial_metric),
      projector_(config.globe),
      reconciler_(config.markers, config.globe),
      extremum_(history),
      landmarks_(config.landmark),
      applier_(renderer) {}

void GlobeSession::load_reference_model(const AABB& bounds) {
    projector_.fit_reference(bounds);
}

void GlobeSession::set_reference_scale(const vec3& scale) {
    projector_.set_reference_scale(scale);
}

void GlobeSession::unload_reference_model() {
    projector_.clear_reference();
}

void GlobeSession::set_marker_prototype_ready(bool ready) {
    prototype_ready_ = ready;
}

markers::SceneContext GlobeSession::scene_context() const {
    markers::SceneContext scene;
    scene.globe_scale = projector_.reference_scale();
    scene.marker_prototype_ready = prototype_ready_;
    scene.selected_country = dataset_->selected_country();
    return scene;
}

const markers::ReconcileResult& GlobeSession::refresh() {
    last_result_ = reconciler_.reconcile(dataset_->samples(metric_), markers_, metric_,
                                         extremum_.global_max(metric_), scene_context());
    markers_ = last_result_.markers;
    applier_.apply(last_result_);
    return last_result_;
}

const markers::ReconcileResult& GlobeSession::set_metric(data::Metric metric) {
    metric_ = metric;
    return refresh();
}

const markers::ReconcileResult& GlobeSession::set_year(int year) {
    dataset_->select_year(year);
    return refresh();
}

quat GlobeSession::set_country(const std::string& country) {
    dataset_->select_country(country);
    refresh();
    return view_orientation();
}

quat GlobeSession::view_orientation() const {
    auto coords = dataset_->coordinates(dataset_->selected_country());
    if (!coords) {
        ATLAS_LOG("No coordinates for '%s'; facing the equator",
                  dataset_->selected_country().c_str());
        return geo::solve_orientation(0.0, 0.0);
    }
    return geo::solve_orientation(coords->latitude, coords->longitude);
}

std::vector<scene::ScatterPoint> GlobeSession::scatter() const {
    return scene::project_scatter(dataset_->countries(), metric_, dataset_->selected_country(),
                                  log_scale_, config_.scatter);
}

bool GlobeSession::show_landmark(markers::LandmarkKind kind) {
    auto coords = dataset_->coordinates(dataset_->selected_country());
    if (!coords) {
        return false;
    }
    auto ops = landmarks_.show(kind, coords->latitude, coords->longitude, projector_);
    if (ops.empty()) {
        return false;
    }
    applier_.apply(ops);
    return true;
}

void GlobeSession::hide_landmark() {
    applier_.apply(landmarks_.hide());
}

} // namespace atlas::session
