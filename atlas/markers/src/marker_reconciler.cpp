#include <markers/marker_reconciler.hpp>
#include <core/debug_log.hpp>

#include <cassert>
#include <unordered_set>

namespace atlas::markers {

float height_fraction(double value, double global_max, double negative_placeholder) {
    double max_value = global_max > 0 ? global_max : 1.0;
    if (value < 0) {
        // "More negative" is not "taller"
        return static_cast<float>(negative_placeholder / max_value);
    }
    return static_cast<float>(value / max_value);
}

ReconcileResult MarkerReconciler::reconcile(const std::vector<data::MetricSample>& samples,
                                            const MarkerMap& previous,
                                            data::Metric metric,
                                            double global_max,
                                            const SceneContext& scene) const {
    ReconcileResult result;

    std::vector<double> values;
    values.reserve(samples.size());
    for (const auto& s : samples) {
        if (s.value) values.push_back(*s.value);
    }
    stats::MetricStats stats = stats::compute_stats(values);
    result.boundaries = stats.boundaries;

    if (!result.boundaries.empty()) {
        ATLAS_LOG("Quintile boundaries for %s: %.2f %.2f %.2f %.2f",
                  data::metric_short_name(metric),
                  result.boundaries[0], result.boundaries[1],
                  result.boundaries[2], result.boundaries[3]);
    } else {
        ATLAS_LOG("Insufficient data for %s quintiles (%zu positive values)",
                  data::metric_short_name(metric), stats.sorted_values.size());
    }

    std::unordered_set<std::string> keys;

    for (const auto& sample : samples) {
        if (!keys.insert(sample.country).second) {
            // First sample wins so each key maps to one renderer handle
            ATLAS_WARN("Duplicate country key '%s' in %s pass; later sample ignored",
                       sample.country.c_str(), data::metric_short_name(metric));
            assert(false && "country keys must be unique within a reconciliation pass");
            continue;
        }
        if (!sample.plottable()) {
            continue;
        }

        auto surface = geo::project(*sample.latitude, *sample.longitude, globe_.visual_radius,
                                    scene.globe_scale, globe_.longitude_calibration_deg);
        if (!surface) {
            ++result.skipped;
            continue;
        }
        if (!scene.marker_prototype_ready) {
            ATLAS_LOG("Marker prototype not loaded; skipping %s", sample.country.c_str());
            ++result.skipped;
            continue;
        }

        double value = *sample.value;
        vec3 outward = surface->normalized();
        float fraction = height_fraction(value, global_max, config_.negative_placeholder_value);

        MarkerState state;
        state.key = sample.country;
        state.position = *surface + outward * outward_offset(fraction, config_);
        state.bin = stats::classify(value, result.boundaries);
        state.selected = (sample.country == scene.selected_country);

        auto existing = previous.find(sample.country);
        if (existing != previous.end()) {
            state.orientation = existing->second.orientation;
            result.operations.push_back(MarkerOp::make_update(state, config_.move_duration));
            ++result.updated;
        } else {
            state.orientation = geo::outward_orientation(*surface);
            result.operations.push_back(MarkerOp::make_create(state));
            ++result.created;
        }

        result.markers[state.key] = std::move(state);
    }

    for (const auto& [key, state] : previous) {
        if (result.markers.count(key) == 0) {
            result.operations.push_back(MarkerOp::make_remove(key));
            ++result.removed;
        }
    }

    auto selected = result.markers.find(scene.selected_country);
    if (selected != result.markers.end()) {
        result.glow_target = selected->first;
    } else {
        ATLAS_LOG("No marker for selected country '%s'", scene.selected_country.c_str());
    }

    ATLAS_LOG("Reconciled %s: %zu created, %zu updated, %zu removed, %zu skipped",
              data::metric_short_name(metric),
              result.created, result.updated, result.removed, result.skipped);
    return result;
}

} // namespace atlas::markers
