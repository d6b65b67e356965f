#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;  // Padded to header width

    [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const;
};

/**
 * @brief RFC 4180 style reader
 *
 * Quoted fields may contain the delimiter, doubled quotes and newlines.
 * CRLF and LF line endings are accepted, a leading UTF-8 BOM is dropped and
 * blank lines are skipped. The first row is the header.
 */
class CsvReader {
public:
    explicit CsvReader(char delimiter = ',') : delimiter_(delimiter) {}

    [[nodiscard]] Result<CsvTable> parse(std::string_view content) const;

    [[nodiscard]] Result<CsvTable> read_file(const std::string& path) const;

private:
    char delimiter_;
};

/**
 * @brief Writes rows, quoting fields only when required
 */
class CsvWriter {
public:
    explicit CsvWriter(std::ostream& out, char delimiter = ',')
        : out_(out), delimiter_(delimiter) {}

    void write_row(const std::vector<std::string>& fields);

    [[nodiscard]] std::string quote(std::string_view field) const;

private:
    std::ostream& out_;
    char delimiter_;
};

} // namespace piiredact
