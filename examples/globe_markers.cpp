// Headless globe driver: loads the energy dataset, runs reconciliation passes
// for a selection and prints the resulting marker operations

#include <core/debug_log.hpp>
#include <core/errors.hpp>
#include <data/centroid_table.hpp>
#include <data/energy_dataset.hpp>
#include <render/marker_renderer.hpp>
#include <session/globe_session.hpp>
#include <stats/quintile_classifier.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace atlas;

void print_usage() {
    std::cout << "Globe Markers" << std::endl;
    std::cout << "=============" << std::endl;
    std::cout << std::endl;
    std::cout << "Places quintile-coloured country markers on a globe for one metric/year" << std::endl;
    std::cout << "and prints the marker operations a renderer would execute." << std::endl;
    std::cout << std::endl;
    std::cout << "OPTIONS:" << std::endl;
    std::cout << "  --data FILE        Multi-year energy CSV (default: energy_data_multi_year_filtered.csv)" << std::endl;
    std::cout << "  --centroids FILE   Country centroid CSV (default: country_centroids.csv)" << std::endl;
    std::cout << "  --metric NAME      ghg, power or energy (default: ghg)" << std::endl;
    std::cout << "  --year N           Year to display (default: 2020)" << std::endl;
    std::cout << "  --compare-year N   Run a second pass for another year and print the diff" << std::endl;
    std::cout << "  --country NAME     Selected country (default: United States)" << std::endl;
    std::cout << "  --landmark KIND    factory, power-lines or cooling-towers at the selected country" << std::endl;
    std::cout << "  --log-scale        Logarithmic axes for the scatter summary" << std::endl;
    std::cout << "  --verbose          Print quintile boundaries and the scatter summary" << std::endl;
    std::cout << "  --help             Show this message" << std::endl;
}

static void print_pass(const char* title, const markers::ReconcileResult& result) {
    std::cout << title << ": " << result.created << " created, " << result.updated
              << " updated, " << result.removed << " removed, " << result.skipped
              << " skipped" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string data_file = "energy_data_multi_year_filtered.csv";
    std::string centroid_file = "country_centroids.csv";
    data::Metric metric = data::Metric::Ghg;
    data::SelectionDefaults defaults;
    std::optional<int> compare_year;
    std::optional<markers::LandmarkKind> landmark;
    bool log_scale = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--data" && has_value) {
            data_file = argv[++i];
        } else if (arg == "--centroids" && has_value) {
            centroid_file = argv[++i];
        } else if (arg == "--metric" && has_value) {
            auto parsed = data::parse_metric(argv[++i]);
            if (!parsed) {
                std::cerr << "Unknown metric: " << argv[i] << std::endl;
                return 1;
            }
            metric = *parsed;
        } else if (arg == "--year" && has_value) {
            defaults.year = std::atoi(argv[++i]);
        } else if (arg == "--compare-year" && has_value) {
            compare_year = std::atoi(argv[++i]);
        } else if (arg == "--country" && has_value) {
            defaults.country = argv[++i];
        } else if (arg == "--landmark" && has_value) {
            landmark = markers::parse_landmark(argv[++i]);
            if (!landmark) {
                std::cerr << "Unknown landmark: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-scale") {
            log_scale = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    data::CentroidTable centroids;
    try {
        centroids = data::CentroidTable::load_from_csv(centroid_file);
    } catch (const DataSourceError& e) {
        // Without centroids every country is unplottable, but the run still reports the data
        std::cerr << "Warning: " << e.what() << std::endl;
    }

    std::optional<data::EnergyDataset> dataset;
    try {
        dataset.emplace(data::EnergyDataset::load_from_csv(data_file, std::move(centroids), defaults));
    } catch (const DataSourceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Loaded " << dataset->row_count() << " rows; year " << dataset->selected_year()
              << " has " << dataset->countries().size() << " countries ("
              << dataset->unresolved_join_count() << " without centroids)" << std::endl;

    data::CsvHistorySource history(data_file);
    auto renderer = render::create_logging_renderer();

    session::SessionConfig config;
    config.initial_metric = metric;
    session::GlobeSession globe(*dataset, history, *renderer, config);

    // Stand-in for the globe asset: a 100-unit model fitted to the desired diameter
    globe.load_reference_model(math::AABB(math::vec3(-50.0f), math::vec3(50.0f)));
    globe.set_log_scale(log_scale);

    std::cout << std::endl << "Metric: " << data::metric_column(metric)
              << " (global max " << globe.global_max() << ")" << std::endl;

    math::quat view = globe.set_country(dataset->selected_country());
    print_pass("Initial pass", globe.last_result());
    std::cout << "View orientation for " << globe.country() << ": (" << view.x << ", " << view.y
              << ", " << view.z << ", " << view.w << ")" << std::endl;

    if (verbose) {
        const auto& b = globe.last_result().boundaries;
        if (b.empty()) {
            std::cout << "Quintiles: insufficient data, all markers in bin "
                      << stats::FALLBACK_BIN << std::endl;
        } else {
            std::cout << "Quintile boundaries: " << b[0] << " " << b[1] << " "
                      << b[2] << " " << b[3] << std::endl;
        }
    }

    if (compare_year) {
        std::cout << std::endl << "Switching to " << *compare_year << std::endl;
        globe.set_year(*compare_year);
        print_pass("Year pass", globe.last_result());
    }

    if (landmark) {
        std::cout << std::endl;
        if (!globe.show_landmark(*landmark)) {
            std::cerr << "Cannot place " << markers::landmark_name(*landmark)
                      << " at " << globe.country() << std::endl;
        }
    }

    if (verbose) {
        auto points = globe.scatter();
        auto labels = scene::axis_labels(log_scale);
        std::cout << std::endl << "Scatter: " << points.size() << " countries on "
                  << labels.x << " / " << labels.y << " / " << labels.z << std::endl;
        for (const auto& p : points) {
            if (p.selected) {
                std::cout << "  " << p.country << " (" << p.x << ", " << p.y << ", " << p.z
                          << ") bucket " << p.bucket << std::endl;
            }
        }
    }

    return 0;
}
