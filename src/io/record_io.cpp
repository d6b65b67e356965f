#include "io/record_io.hpp"

#include <format>
#include <optional>

namespace piiredact {

Result<std::vector<RawRecord>> RecordSource::from_table(
    const CsvTable& table, const InputConfig& config) {

    const auto id_col = table.column_index(config.record_id_column);
    if (!id_col) {
        return Result<std::vector<RawRecord>>::error(ErrorCategory::PARSE_ERROR,
            std::format("Missing record id column '{}'", config.record_id_column));
    }

    std::optional<size_t> data_col;
    for (const auto& name : config.data_columns) {
        data_col = table.column_index(name);
        if (data_col) break;
    }
    if (!data_col) {
        return Result<std::vector<RawRecord>>::error(ErrorCategory::PARSE_ERROR,
            "Missing payload column (none of the configured data columns is present)");
    }

    std::vector<RawRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RawRecord rec;
        rec.record_id = *id_col < row.size() ? row[*id_col] : std::string{};
        rec.payload = *data_col < row.size() ? row[*data_col] : std::string{};
        records.emplace_back(std::move(rec));
    }
    return Result<std::vector<RawRecord>>::ok(std::move(records));
}

RecordSink::RecordSink(std::ostream& out, OutputConfig config)
    : writer_(out), config_(std::move(config)) {}

void RecordSink::write_header() {
    writer_.write_row({config_.record_id_column, config_.data_column, config_.verdict_column});
}

void RecordSink::write(const OutputRecord& record) {
    writer_.write_row({record.record_id, record.redacted_json, record.is_pii ? "True" : "False"});
}

} // namespace piiredact
