#include <data/metric.hpp>

namespace atlas::data {

const char* metric_column(Metric metric) {
    switch (metric) {
        case Metric::Ghg:    return "Greenhouse Gas Emissions (Mt CO2e)";
        case Metric::Power:  return "Electric Power Consumption (kWh per capita)";
        case Metric::Energy: return "Energy Use (kg oil equivalent per capita)";
    }
    return "";
}

const char* metric_short_name(Metric metric) {
    switch (metric) {
        case Metric::Ghg:    return "ghg";
        case Metric::Power:  return "power";
        case Metric::Energy: return "energy";
    }
    return "";
}

std::optional<Metric> parse_metric(std::string_view text) {
    for (Metric m : ALL_METRICS) {
        if (text == metric_short_name(m) || text == metric_column(m)) {
            return m;
        }
    }
    return std::nullopt;
}

} // namespace atlas::data
