#include <data/centroid_table.hpp>
#include <data/csv_reader.hpp>
#include <core/debug_log.hpp>

namespace atlas::data {

CentroidTable CentroidTable::load_from_csv(const std::string& path) {
    CsvTable table = CsvTable::read_file(path);
    size_t name_col = table.require_column("COUNTRY");
    size_t lat_col = table.require_column("latitude");
    size_t lon_col = table.require_column("longitude");

    CentroidTable result;
    size_t skipped = 0;
    for (const auto& row : table.rows()) {
        std::string name(table.cell(row, name_col));
        auto lat = parse_double(table.cell(row, lat_col));
        auto lon = parse_double(table.cell(row, lon_col));
        if (name.empty() || !lat || !lon) {
            ++skipped;
            continue;
        }
        result.insert(name, GeoCoordinate{*lat, *lon});
    }

    if (skipped > 0) {
        ATLAS_WARN("%zu unparsable rows skipped in %s", skipped, path.c_str());
    }
    ATLAS_LOG("Loaded %zu country centroids from %s", result.size(), path.c_str());
    return result;
}

std::optional<GeoCoordinate> CentroidTable::lookup(const std::string& country) const {
    auto it = coordinates_.find(country);
    if (it == coordinates_.end()) return std::nullopt;
    return it->second;
}

} // namespace atlas::data
