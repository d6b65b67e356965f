#include "io/csv.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace piiredact {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_blank_row(const std::vector<std::string>& row) {
    return row.size() == 1 && row[0].empty();
}

} // anonymous namespace

std::optional<size_t> CsvTable::column_index(std::string_view name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return i;
    }
    return std::nullopt;
}

Result<CsvTable> CsvReader::parse(std::string_view content) const {
    if (content.starts_with(kUtf8Bom)) {
        content.remove_prefix(kUtf8Bom.size());
    }

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_was_quoted = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto end_field = [&] {
        row.emplace_back(std::move(field));
        field.clear();
        field_was_quoted = false;
    };
    auto end_row = [&] {
        end_field();
        if (!is_blank_row(row)) {
            records.emplace_back(std::move(row));
        }
        row.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == '"' && field.empty() && !field_was_quoted) {
            in_quotes = true;
            field_was_quoted = true;
            quote_line = line;
        } else if (c == delimiter_) {
            end_field();
        } else if (c == '\r') {
            // CRLF: the '\n' ends the row; a lone CR is dropped
        } else if (c == '\n') {
            end_row();
            ++line;
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        return Result<CsvTable>::error(ErrorCategory::PARSE_ERROR,
            std::format("Unterminated quoted field starting on line {}", quote_line));
    }
    if (!field.empty() || !row.empty() || field_was_quoted) {
        end_row();
    }

    if (records.empty()) {
        return Result<CsvTable>::error(ErrorCategory::PARSE_ERROR, "CSV input has no header row");
    }

    CsvTable table;
    table.header = std::move(records.front());
    table.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        auto& rec = records[r];
        if (rec.size() < table.header.size()) {
            rec.resize(table.header.size());
        }
        table.rows.emplace_back(std::move(rec));
    }
    return Result<CsvTable>::ok(std::move(table));
}

Result<CsvTable> CsvReader::read_file(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open input file: {}", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Failed reading input file: {}", path));
    }
    return parse(buffer.str());
}

std::string CsvWriter::quote(std::string_view field) const {
    const bool needs_quotes =
        field.find_first_of(std::string{delimiter_, '"', '\n', '\r'}) != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += '"';
    for (const char c : field) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out_ << delimiter_;
        out_ << quote(fields[i]);
    }
    out_ << '\n';
}

} // namespace piiredact
