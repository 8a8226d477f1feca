// All-time maximum per metric, computed lazily from the full multi-year history

#pragma once

#include <data/records.hpp>

#include <array>
#include <optional>

namespace atlas::markers {

constexpr double DEFAULT_GLOBAL_MAX = 1.0;

class GlobalExtremumCache {
public:
    // `source` must outlive the cache
    explicit GlobalExtremumCache(const data::IHistorySource& source) : source_(&source) {}

    // Largest value of `metric` across every year. DEFAULT_GLOBAL_MAX when the
    // history has no positive value; also DEFAULT_GLOBAL_MAX, uncached, when the
    // source cannot be read.
    double global_max(data::Metric metric);

    bool is_cached(data::Metric metric) const {
        return cache_[data::metric_index(metric)].has_value();
    }

    void reset() { cache_.fill(std::nullopt); }

private:
    const data::IHistorySource* source_;
    std::array<std::optional<double>, data::METRIC_COUNT> cache_;
};

} // namespace atlas::markers
