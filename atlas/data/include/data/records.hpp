// In-memory records produced by the data layer
// Display names are the join key between the energy rows and the centroid table

#pragma once

#include <data/metric.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace atlas::data {

using MetricValues = std::array<std::optional<double>, METRIC_COUNT>;

struct GeoCoordinate {
    double latitude;
    double longitude;
};

// One row of the multi-year dataset (one country, one year, all metrics)
struct HistoryRow {
    std::string country_name;
    std::string country_code;
    int year = 0;
    MetricValues values;

    std::optional<double> value(Metric metric) const { return values[metric_index(metric)]; }
};

// A country in the currently selected year, joined with its centroid
struct CountryRecord {
    std::string name;
    std::string code;
    int year = 0;
    MetricValues values;
    std::optional<GeoCoordinate> location;  // Absent when the centroid join failed

    std::optional<double> value(Metric metric) const { return values[metric_index(metric)]; }
};

// One country's value for one metric in one year
struct MetricSample {
    std::string country;             // Stable key, unique within a year
    std::optional<double> value;     // May be negative
    std::optional<double> latitude;
    std::optional<double> longitude;
    int year = 0;

    bool has_location() const { return latitude.has_value() && longitude.has_value(); }

    // Coordinates plus a non-null, non-zero value
    bool plottable() const { return has_location() && value.has_value() && *value != 0.0; }
};

// Source of every row across all years (global maximum scans)
class IHistorySource {
public:
    virtual ~IHistorySource() = default;

    // Throws DataSourceError when the underlying data cannot be read
    virtual std::vector<HistoryRow> all_years_rows() const = 0;
};

} // namespace atlas::data
