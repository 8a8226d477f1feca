// Three-axis scatter encoding of the selected year's countries
// X = electric power, Y = energy use, Z = greenhouse gas emissions

#pragma once

#include <data/records.hpp>
#include <math/types.hpp>

#include <string>
#include <vector>

namespace atlas::scene {

struct ScatterConfig {
    float selected_symbol_size = 0.02f;
    float symbol_size = 0.005f;
    double log_floor = 0.1;          // log10(max(v + 1, floor))
};

// Buckets are 1-based here, matching the chart legend
constexpr int SCATTER_FALLBACK_BUCKET = 3;

struct ScatterPoint {
    std::string country;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    int bucket = SCATTER_FALLBACK_BUCKET;
    math::vec4 color;
    float symbol_size = 0.0f;
    bool selected = false;
};

struct AxisLabels {
    const char* x;
    const char* y;
    const char* z;
};

AxisLabels axis_labels(bool logarithmic);

double scale_axis_value(double value, bool logarithmic, double log_floor = 0.1);

// Countries with all three metrics present, bucketed on `metric`
std::vector<ScatterPoint> project_scatter(const std::vector<data::CountryRecord>& countries,
                                          data::Metric metric,
                                          const std::string& selected_country,
                                          bool logarithmic,
                                          const ScatterConfig& config = {});

} // namespace atlas::scene
