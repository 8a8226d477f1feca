// Minimal CSV reading for the dataset files

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atlas::data {

using CsvRow = std::vector<std::string>;

// Parse a single CSV line into fields (handles quoted fields and "" escapes)
CsvRow parse_csv_line(std::string_view line);

// Trim whitespace from both ends
std::string trim(std::string_view text);

// True for empty or whitespace-only lines
bool is_blank(std::string_view line);

// Full-consumption numeric parse; empty or malformed text yields nothing
std::optional<double> parse_double(std::string_view text);

// Strict integer parse for year cells
std::optional<int> parse_int(std::string_view text);

// Header-indexed CSV contents
class CsvTable {
public:
    CsvTable() = default;
    CsvTable(std::string source, CsvRow header, std::vector<CsvRow> rows);

    // Reads and parses a whole file; throws FileUnavailableError
    static CsvTable read_file(const std::string& path);

    // Parses in-memory text (first non-blank line is the header)
    static CsvTable parse(std::string_view text, std::string source = "<memory>");

    const std::string& source() const { return source_; }
    const CsvRow& header() const { return header_; }
    const std::vector<CsvRow>& rows() const { return rows_; }
    size_t row_count() const { return rows_.size(); }

    std::optional<size_t> column_index(std::string_view name) const;

    // Throws CsvFormatError when the column is missing
    size_t require_column(std::string_view name) const;

    // Cell text, or empty when the row is shorter than the header
    std::string_view cell(const CsvRow& row, size_t column) const;

private:
    std::string source_;
    CsvRow header_;
    std::vector<CsvRow> rows_;
};

} // namespace atlas::data
