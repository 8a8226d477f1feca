#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace atlas {

// Exception types for dataset I/O
class DataSourceError : public std::runtime_error {
public:
    DataSourceError(const std::string& message, std::string path = {})
        : std::runtime_error(message), path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class FileUnavailableError : public DataSourceError {
public:
    explicit FileUnavailableError(const std::string& path)
        : DataSourceError("Cannot open data file: " + path, path) {}
};

class CsvFormatError : public DataSourceError {
public:
    CsvFormatError(const std::string& path, const std::string& column)
        : DataSourceError("CSV format error: " + path + " has no column '" + column + "'", path),
          column_(column) {}

    const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

} // namespace atlas
