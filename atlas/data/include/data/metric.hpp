// Metric catalogue: the three energy indicators carried by every dataset row

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace atlas::data {

enum class Metric : uint8_t {
    Ghg,     // Greenhouse gas emissions (Mt CO2e)
    Power,   // Electric power consumption (kWh per capita)
    Energy   // Energy use (kg of oil equivalent per capita)
};

constexpr size_t METRIC_COUNT = 3;

constexpr std::array<Metric, METRIC_COUNT> ALL_METRICS = {
    Metric::Ghg, Metric::Power, Metric::Energy
};

constexpr size_t metric_index(Metric metric) { return static_cast<size_t>(metric); }

// Column header used by the multi-year CSV
const char* metric_column(Metric metric);

// Short command-line name ("ghg", "power", "energy")
const char* metric_short_name(Metric metric);

// Accepts a short name or the full column header
std::optional<Metric> parse_metric(std::string_view text);

} // namespace atlas::data
