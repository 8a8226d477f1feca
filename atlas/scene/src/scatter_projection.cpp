#include <scene/scatter_projection.hpp>
#include <scene/color_palette.hpp>
#include <stats/quintile_classifier.hpp>
#include <core/debug_log.hpp>

#include <algorithm>
#include <cmath>

namespace atlas::scene {

namespace {

bool has_all_metrics(const data::CountryRecord& c) {
    for (data::Metric m : data::ALL_METRICS) {
        if (!c.value(m)) return false;
    }
    return true;
}

} // namespace

AxisLabels axis_labels(bool logarithmic) {
    if (logarithmic) {
        return {"log10(Power + 1)", "log10(Energy + 1)", "log10(GHG + 1)"};
    }
    return {"Power (kWh/cap)", "Energy (kg OE/cap)", "GHG (Mt CO2e)"};
}

double scale_axis_value(double value, bool logarithmic, double log_floor) {
    if (!logarithmic) return value;
    return std::log10(std::max(value + 1.0, log_floor));
}

std::vector<ScatterPoint> project_scatter(const std::vector<data::CountryRecord>& countries,
                                          data::Metric metric,
                                          const std::string& selected_country,
                                          bool logarithmic,
                                          const ScatterConfig& config) {
    std::vector<const data::CountryRecord*> charted;
    std::vector<double> bucket_values;
    for (const auto& c : countries) {
        if (!has_all_metrics(c)) continue;
        charted.push_back(&c);
        bucket_values.push_back(*c.value(metric));
    }

    stats::QuantileBoundaries thresholds = stats::nearest_rank_boundaries(bucket_values);

    std::vector<ScatterPoint> points;
    points.reserve(charted.size());
    int counts[stats::BIN_COUNT] = {0, 0, 0, 0, 0};
    for (const auto* c : charted) {
        ScatterPoint p;
        p.country = c->name;
        p.x = scale_axis_value(*c->value(data::Metric::Power), logarithmic, config.log_floor);
        p.y = scale_axis_value(*c->value(data::Metric::Energy), logarithmic, config.log_floor);
        p.z = scale_axis_value(*c->value(data::Metric::Ghg), logarithmic, config.log_floor);
        if (!thresholds.empty()) {
            p.bucket = stats::classify(*c->value(metric), thresholds) + 1;
        }
        p.color = colors::quintile_color(p.bucket - 1);
        p.selected = (c->name == selected_country);
        p.symbol_size = p.selected ? config.selected_symbol_size : config.symbol_size;
        ++counts[p.bucket - 1];
        points.push_back(std::move(p));
    }

    ATLAS_LOG("Scatter buckets (1-5): %d %d %d %d %d",
              counts[0], counts[1], counts[2], counts[3], counts[4]);
    return points;
}

} // namespace atlas::scene
