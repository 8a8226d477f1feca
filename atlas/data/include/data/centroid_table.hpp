// Country centroid lookup keyed by display name

#pragma once

#include <data/records.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace atlas::data {

class CentroidTable {
public:
    CentroidTable() = default;

    // Columns COUNTRY, latitude, longitude; unparsable rows are skipped.
    // Throws FileUnavailableError / CsvFormatError.
    static CentroidTable load_from_csv(const std::string& path);

    void insert(const std::string& country, GeoCoordinate coordinate) {
        coordinates_[country] = coordinate;
    }

    std::optional<GeoCoordinate> lookup(const std::string& country) const;

    size_t size() const { return coordinates_.size(); }
    bool empty() const { return coordinates_.empty(); }

private:
    std::unordered_map<std::string, GeoCoordinate> coordinates_;
};

} // namespace atlas::data
