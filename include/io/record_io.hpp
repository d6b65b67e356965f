#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "io/csv.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace piiredact {

// One input row: opaque id plus the serialized field map (may be empty)
struct RawRecord {
    std::string record_id;
    std::string payload;
};

// One output row
struct OutputRecord {
    std::string record_id;
    std::string redacted_json;
    bool is_pii = false;
};

/**
 * @brief Extracts (record_id, payload) pairs from a CSV table
 */
class RecordSource {
public:
    /**
     * @return Records in input order, or PARSE_ERROR when the id column or
     *         every configured payload column is missing from the header
     */
    [[nodiscard]] static Result<std::vector<RawRecord>> from_table(
        const CsvTable& table, const InputConfig& config);
};

/**
 * @brief Writes the header and one row per processed record
 */
class RecordSink {
public:
    RecordSink(std::ostream& out, OutputConfig config);

    void write_header();
    void write(const OutputRecord& record);

private:
    CsvWriter writer_;
    OutputConfig config_;
};

} // namespace piiredact
