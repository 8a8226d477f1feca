// Marker reconciliation: turns the current year's samples into a diff against
// the previous pass's marker set
//
// Markers are keyed by country name and updated in place while a country stays
// plottable. A country that is not seen in a pass (no coordinates, no value, zero
// value, or a missing dependency) loses its marker.

#pragma once

#include <data/records.hpp>
#include <geo/geo_projector.hpp>
#include <markers/marker_ops.hpp>
#include <stats/quintile_classifier.hpp>

#include <optional>
#include <string>
#include <vector>

namespace atlas::markers {

struct MarkerConfig {
    float base_offset = 0.002f;                // Outward lift for the smallest marker
    float height_scale = 0.030f;               // Extra lift at the global maximum
    float move_duration = 0.6f;                // Seconds for animated updates
    double negative_placeholder_value = 0.1;   // Height stand-in for negative values
};

// External dependencies as seen by one pass
struct SceneContext {
    std::optional<vec3> globe_scale;      // Absent until the reference model is loaded
    bool marker_prototype_ready = true;   // Marker template loaded
    std::string selected_country;
};

struct ReconcileResult {
    std::vector<MarkerOp> operations;
    MarkerMap markers;
    std::optional<std::string> glow_target;   // Selected country's marker, if it has one
    stats::QuantileBoundaries boundaries;

    size_t created = 0;
    size_t updated = 0;
    size_t removed = 0;
    size_t skipped = 0;   // Plottable samples dropped for a missing dependency
};

// Normalised height in [0, 1] for positive values; negative values use the placeholder
float height_fraction(double value, double global_max, double negative_placeholder = 0.1);

// Distance along the outward normal
inline float outward_offset(float fraction, const MarkerConfig& config) {
    return config.base_offset + fraction * config.height_scale;
}

class MarkerReconciler {
public:
    explicit MarkerReconciler(MarkerConfig config = {}, geo::GlobeConfig globe = {})
        : config_(config), globe_(globe) {}

    const MarkerConfig& config() const { return config_; }

    // `global_max` is the metric's all-time maximum so heights stay comparable
    // across years. Country keys in `samples` must be unique.
    ReconcileResult reconcile(const std::vector<data::MetricSample>& samples,
                              const MarkerMap& previous,
                              data::Metric metric,
                              double global_max,
                              const SceneContext& scene) const;

private:
    MarkerConfig config_;
    geo::GlobeConfig globe_;
};

} // namespace atlas::markers
