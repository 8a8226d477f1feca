#include <markers/global_extremum_cache.hpp>
#include <core/debug_log.hpp>
#include <core/errors.hpp>

namespace atlas::markers {

double GlobalExtremumCache::global_max(data::Metric metric) {
    auto& slot = cache_[data::metric_index(metric)];
    if (slot) {
        return *slot;
    }

    std::vector<data::HistoryRow> rows;
    try {
        rows = source_->all_years_rows();
    } catch (const DataSourceError& e) {
        ATLAS_WARN("Global max for %s unavailable: %s", data::metric_short_name(metric), e.what());
        return DEFAULT_GLOBAL_MAX;
    }

    double max_value = 0.0;
    for (const auto& row : rows) {
        auto v = row.value(metric);
        if (v && *v > max_value) {
            max_value = *v;
        }
    }
    if (max_value <= 0.0) {
        max_value = DEFAULT_GLOBAL_MAX;
    }

    slot = max_value;
    ATLAS_LOG("Global max for %s: %f", data::metric_short_name(metric), max_value);
    return max_value;
}

} // namespace atlas::markers
