#include <data/csv_reader.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace atlas::data {

CsvRow parse_csv_line(std::string_view line) {
    CsvRow fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == ',' && !in_quotes) {
            fields.push_back(trim(field));
            field.clear();
        } else if (c == '\r' && i + 1 == line.size()) {
            // CRLF files
        } else {
            field += c;
        }
    }

    fields.push_back(trim(field));
    return fields;
}

std::string trim(std::string_view text) {
    auto start = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool is_blank(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::optional<double> parse_double(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parse_int(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

CsvTable::CsvTable(std::string source, CsvRow header, std::vector<CsvRow> rows)
    : source_(std::move(source)), header_(std::move(header)), rows_(std::move(rows)) {}

CsvTable CsvTable::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileUnavailableError(path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw FileUnavailableError(path);
    }
    return parse(contents.str(), path);
}

CsvTable CsvTable::parse(std::string_view text, std::string source) {
    CsvRow header;
    std::vector<CsvRow> rows;
    bool have_header = false;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        std::string_view line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? text.size() + 1 : eol + 1;

        if (is_blank(line)) continue;

        CsvRow fields = parse_csv_line(line);
        if (!have_header) {
            // Strip a UTF-8 byte order mark from the first header cell
            if (!fields.empty() && fields[0].rfind("\xEF\xBB\xBF", 0) == 0) {
                fields[0].erase(0, 3);
            }
            header = std::move(fields);
            have_header = true;
        } else {
            rows.push_back(std::move(fields));
        }
    }

    return CsvTable(std::move(source), std::move(header), std::move(rows));
}

std::optional<size_t> CsvTable::column_index(std::string_view name) const {
    for (size_t i = 0; i < header_.size(); ++i) {
        if (header_[i] == name) return i;
    }
    return std::nullopt;
}

size_t CsvTable::require_column(std::string_view name) const {
    auto index = column_index(name);
    if (!index) {
        throw CsvFormatError(source_, std::string(name));
    }
    return *index;
}

std::string_view CsvTable::cell(const CsvRow& row, size_t column) const {
    if (column >= row.size()) return {};
    return row[column];
}

} // namespace atlas::data
