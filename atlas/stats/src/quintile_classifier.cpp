#include <stats/quintile_classifier.hpp>

#include <algorithm>
#include <cmath>

namespace atlas::stats {

double interpolated_percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;

    double index = p * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(index));
    size_t upper = static_cast<size_t>(std::ceil(index));
    if (lower == upper) {
        return sorted[lower];
    }
    double weight = index - static_cast<double>(lower);
    return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

MetricStats compute_stats(const std::vector<double>& values) {
    MetricStats stats;
    stats.sorted_values.reserve(values.size());
    for (double v : values) {
        if (v > 0) stats.sorted_values.push_back(v);
    }
    std::sort(stats.sorted_values.begin(), stats.sorted_values.end());

    if (stats.sorted_values.size() < MIN_QUANTILE_SAMPLES) {
        return stats;
    }

    stats.boundaries.thresholds.reserve(QUINTILE_PERCENTILES.size());
    for (double p : QUINTILE_PERCENTILES) {
        stats.boundaries.thresholds.push_back(interpolated_percentile(stats.sorted_values, p));
    }
    return stats;
}

QuantileBoundaries compute_boundaries(const std::vector<double>& values) {
    return compute_stats(values).boundaries;
}

int classify(double value, const QuantileBoundaries& boundaries) {
    if (boundaries.empty()) {
        return FALLBACK_BIN;
    }
    for (size_t i = 0; i < boundaries.size(); ++i) {
        if (value <= boundaries[i]) return static_cast<int>(i);
    }
    return static_cast<int>(boundaries.size());
}

const char* bin_name(int bin) {
    static const char* const names[BIN_COUNT] = {"Lowest", "Low", "Medium", "High", "Highest"};
    if (bin < 0 || bin >= BIN_COUNT) return "Unknown";
    return names[bin];
}

QuantileBoundaries nearest_rank_boundaries(const std::vector<double>& values) {
    QuantileBoundaries result;
    if (values.empty()) return result;

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());
    size_t n = sorted.size();
    for (double p : QUINTILE_PERCENTILES) {
        size_t rank = static_cast<size_t>(static_cast<double>(n) * p);
        result.thresholds.push_back(sorted[std::min(rank, n - 1)]);
    }
    return result;
}

} // namespace atlas::stats
