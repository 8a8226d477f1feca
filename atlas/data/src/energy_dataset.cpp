#include <data/energy_dataset.hpp>
#include <data/csv_reader.hpp>
#include <core/debug_log.hpp>

#include <algorithm>
#include <unordered_set>

namespace atlas::data {

std::vector<HistoryRow> read_history_csv(const std::string& path) {
    CsvTable table = CsvTable::read_file(path);
    size_t name_col = table.require_column("Country Name");
    size_t year_col = table.require_column("Year");
    auto code_col = table.column_index("Country Code");

    std::array<std::optional<size_t>, METRIC_COUNT> metric_cols;
    for (Metric m : ALL_METRICS) {
        metric_cols[metric_index(m)] = table.column_index(metric_column(m));
        if (!metric_cols[metric_index(m)]) {
            ATLAS_LOG("%s has no column '%s'; values treated as missing",
                      path.c_str(), metric_column(m));
        }
    }

    std::vector<HistoryRow> rows;
    rows.reserve(table.row_count());
    for (const auto& cells : table.rows()) {
        auto year = parse_int(table.cell(cells, year_col));
        if (!year) continue;

        HistoryRow row;
        row.country_name = std::string(table.cell(cells, name_col));
        if (row.country_name.empty()) row.country_name = "Unknown";
        if (code_col) row.country_code = std::string(table.cell(cells, *code_col));
        row.year = *year;
        for (Metric m : ALL_METRICS) {
            const auto& col = metric_cols[metric_index(m)];
            if (col) row.values[metric_index(m)] = parse_double(table.cell(cells, *col));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

EnergyDataset::EnergyDataset(std::vector<HistoryRow> rows, CentroidTable centroids,
                             SelectionDefaults defaults)
    : rows_(std::move(rows)),
      centroids_(std::move(centroids)),
      available_years_(std::move(defaults.available_years)),
      selected_year_(defaults.year),
      selected_country_(std::move(defaults.country)) {
    select_year(selected_year_);
}

EnergyDataset EnergyDataset::load_from_csv(const std::string& data_path, CentroidTable centroids,
                                           SelectionDefaults defaults) {
    return EnergyDataset(read_history_csv(data_path), std::move(centroids), std::move(defaults));
}

void EnergyDataset::select_year(int year) {
    selected_year_ = year;
    countries_.clear();
    unresolved_joins_ = 0;

    std::unordered_set<std::string> seen;
    for (const auto& row : rows_) {
        if (row.year != year) continue;
        // Country names key markers; keep the first row per name
        if (!seen.insert(row.country_name).second) {
            ATLAS_WARN("Duplicate row for %s in %d ignored", row.country_name.c_str(), year);
            continue;
        }

        CountryRecord record;
        record.name = row.country_name;
        record.code = row.country_code;
        record.year = row.year;
        record.values = row.values;
        record.location = centroids_.lookup(row.country_name);
        if (!record.location) {
            ++unresolved_joins_;
            ATLAS_LOG("No centroid coordinates for %s; marker will not be placed",
                      row.country_name.c_str());
        }
        countries_.push_back(std::move(record));
    }

    std::sort(countries_.begin(), countries_.end(),
              [](const CountryRecord& a, const CountryRecord& b) { return a.name < b.name; });

    if (!find_country(selected_country_)) {
        selected_country_ = countries_.empty() ? std::string() : countries_.front().name;
    }

    ATLAS_LOG("Selected %zu countries for year %d (%zu without centroids)",
              countries_.size(), year, unresolved_joins_);
}

std::vector<MetricSample> EnergyDataset::samples(Metric metric) const {
    std::vector<MetricSample> result;
    result.reserve(countries_.size());
    for (const auto& c : countries_) {
        MetricSample s;
        s.country = c.name;
        s.value = c.value(metric);
        if (c.location) {
            s.latitude = c.location->latitude;
            s.longitude = c.location->longitude;
        }
        s.year = c.year;
        result.push_back(std::move(s));
    }
    return result;
}

const CountryRecord* EnergyDataset::find_country(const std::string& country) const {
    for (const auto& c : countries_) {
        if (c.name == country) return &c;
    }
    return nullptr;
}

std::optional<double> EnergyDataset::value(const std::string& country, Metric metric) const {
    const CountryRecord* c = find_country(country);
    if (!c) return std::nullopt;
    return c->value(metric);
}

std::optional<GeoCoordinate> EnergyDataset::coordinates(const std::string& country) const {
    const CountryRecord* c = find_country(country);
    if (!c) return std::nullopt;
    return c->location;
}

} // namespace atlas::data
