// Quintile classification of metric values
//
// Boundaries are the 20th/40th/60th/80th percentiles of the positive values,
// linearly interpolated between order statistics on the 0-indexed sorted array.
// With fewer than MIN_QUANTILE_SAMPLES positive values no boundaries exist and
// every value classifies into FALLBACK_BIN.

#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace atlas::stats {

constexpr int BIN_COUNT = 5;
constexpr int FALLBACK_BIN = 2;
constexpr size_t MIN_QUANTILE_SAMPLES = 5;
constexpr std::array<double, 4> QUINTILE_PERCENTILES = {0.2, 0.4, 0.6, 0.8};

struct QuantileBoundaries {
    std::vector<double> thresholds;  // Empty, or 4 non-decreasing values

    bool empty() const { return thresholds.empty(); }
    size_t size() const { return thresholds.size(); }
    double operator[](size_t i) const { return thresholds[i]; }
};

// Sorted basis plus boundaries (kept together for logging and charts)
struct MetricStats {
    std::vector<double> sorted_values;
    QuantileBoundaries boundaries;
};

// Percentile p in [0, 1] of an ascending range, interpolating between neighbours
double interpolated_percentile(const std::vector<double>& sorted, double p);

QuantileBoundaries compute_boundaries(const std::vector<double>& values);

MetricStats compute_stats(const std::vector<double>& values);

// 0..4 under the <= rule; FALLBACK_BIN when boundaries are empty
int classify(double value, const QuantileBoundaries& boundaries);

// "Lowest", "Low", "Medium", "High", "Highest"
const char* bin_name(int bin);

// Nearest-rank thresholds used by the scatter chart: sorted[min(floor(n*p), n-1)].
// No positivity filter; empty input gives empty boundaries.
QuantileBoundaries nearest_rank_boundaries(const std::vector<double>& values);

} // namespace atlas::stats
