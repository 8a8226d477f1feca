// Selection state and control flow for the globe
//
// Every change of metric, year or country runs one reconciliation pass against
// the previous marker map and applies the resulting operations to the renderer.
// Country changes also produce the globe orientation that faces the country.

#pragma once

#include <data/energy_dataset.hpp>
#include <geo/geo_projector.hpp>
#include <geo/view_orientation.hpp>
#include <markers/global_extremum_cache.hpp>
#include <markers/landmark_placer.hpp>
#include <markers/marker_reconciler.hpp>
#include <render/marker_scene_applier.hpp>
#include <scene/scatter_projection.hpp>

#include <string>
#include <vector>

namespace atlas::session {

using namespace math;

struct SessionConfig {
    geo::GlobeConfig globe;
    markers::MarkerConfig markers;
    markers::LandmarkConfig landmark;
    scene::ScatterConfig scatter;
    data::Metric initial_metric = data::Metric::Ghg;
};

class GlobeSession {
public:
    // `dataset`, `history` and `renderer` must outlive the session
    GlobeSession(data::EnergyDataset& dataset,
                 const data::IHistorySource& history,
                 render::IMarkerRenderer& renderer,
                 SessionConfig config = {});

    // Reference globe model and marker prototype availability
    void load_reference_model(const AABB& bounds);
    void set_reference_scale(const vec3& scale);
    void unload_reference_model();
    void set_marker_prototype_ready(bool ready);

    const markers::ReconcileResult& set_metric(data::Metric metric);
    const markers::ReconcileResult& set_year(int year);

    // Runs a pass and returns the globe rotation facing the country
    quat set_country(const std::string& country);

    // Re-run a pass with the current selection (e.g. after a dependency loads)
    const markers::ReconcileResult& refresh();

    // Orientation for the current selection (equator/prime meridian when unknown)
    quat view_orientation() const;

    void set_log_scale(bool enabled) { log_scale_ = enabled; }
    bool log_scale() const { return log_scale_; }

    std::vector<scene::ScatterPoint> scatter() const;

    // Landmark at the selected country's centroid; false when it cannot be placed
    bool show_landmark(markers::LandmarkKind kind);
    void hide_landmark();

    data::Metric metric() const { return metric_; }
    int year() const { return dataset_->selected_year(); }
    const std::string& country() const { return dataset_->selected_country(); }

    const markers::MarkerMap& markers() const { return markers_; }
    const markers::ReconcileResult& last_result() const { return last_result_; }
    double global_max() { return extremum_.global_max(metric_); }

private:
    markers::SceneContext scene_context() const;

    data::EnergyDataset* dataset_;
    SessionConfig config_;
    data::Metric metric_;
    bool log_scale_ = false;
    bool prototype_ready_ = true;

    geo::GeoProjector projector_;
    markers::MarkerReconciler reconciler_;
    markers::GlobalExtremumCache extremum_;
    markers::LandmarkPlacer landmarks_;
    render::MarkerSceneApplier applier_;

    markers::MarkerMap markers_;
    markers::ReconcileResult last_result_;
};

} // namespace atlas::session
