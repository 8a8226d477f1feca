// Multi-year energy dataset with a selected year and selected country
//
// All rows are held in memory. Selecting a year rebuilds that year's country
// list, joins centroid coordinates by display name and sorts by name.

#pragma once

#include <data/centroid_table.hpp>
#include <data/records.hpp>

#include <string>
#include <utility>
#include <vector>

namespace atlas::data {

struct SelectionDefaults {
    Metric metric = Metric::Ghg;
    std::string country = "United States";
    int year = 2020;
    std::vector<int> available_years = {
        2005, 2006, 2007, 2008, 2009, 2010, 2011, 2012, 2013,
        2014, 2015, 2016, 2017, 2018, 2019, 2020, 2021, 2022
    };
};

// Parses the multi-year CSV ("Country Name", "Country Code", "Year" and the
// metric columns). Rows without a parsable year are skipped.
// Throws FileUnavailableError / CsvFormatError.
std::vector<HistoryRow> read_history_csv(const std::string& path);

// Re-reads the CSV on every scan
class CsvHistorySource : public IHistorySource {
public:
    explicit CsvHistorySource(std::string path) : path_(std::move(path)) {}

    std::vector<HistoryRow> all_years_rows() const override { return read_history_csv(path_); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class EnergyDataset : public IHistorySource {
public:
    EnergyDataset(std::vector<HistoryRow> rows, CentroidTable centroids,
                  SelectionDefaults defaults = {});

    static EnergyDataset load_from_csv(const std::string& data_path, CentroidTable centroids,
                                       SelectionDefaults defaults = {});

    // Rebuild the country list for `year`; keeps the selected country if it
    // exists that year, otherwise falls back to the first country (or "")
    void select_year(int year);
    int selected_year() const { return selected_year_; }

    void select_country(const std::string& country) { selected_country_ = country; }
    const std::string& selected_country() const { return selected_country_; }

    const std::vector<int>& available_years() const { return available_years_; }

    // Selected year's countries, sorted by name
    const std::vector<CountryRecord>& countries() const { return countries_; }

    // Selected year's samples for one metric, in country order
    std::vector<MetricSample> samples(Metric metric) const;

    std::optional<double> value(const std::string& country, Metric metric) const;
    std::optional<GeoCoordinate> coordinates(const std::string& country) const;
    const CountryRecord* find_country(const std::string& country) const;

    // Countries in the selected year with no centroid match
    size_t unresolved_join_count() const { return unresolved_joins_; }

    std::vector<HistoryRow> all_years_rows() const override { return rows_; }
    size_t row_count() const { return rows_.size(); }

private:
    std::vector<HistoryRow> rows_;
    CentroidTable centroids_;
    std::vector<int> available_years_;

    int selected_year_;
    std::string selected_country_;
    std::vector<CountryRecord> countries_;
    size_t unresolved_joins_ = 0;
};

} // namespace atlas::data
