#pragma once

#include "classifier/rule_set.hpp"
#include "core/masking.hpp"

#include <string>
#include <vector>

namespace piiredact {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct InputConfig {
    std::string record_id_column = "record_id";
    // Payload column; first name present in the header wins
    std::vector<std::string> data_columns = {"data_json", "Data_json", "Data_JSON"};
    char delimiter = ',';
};

struct OutputConfig {
    std::string file = "redacted_output.csv";
    std::string record_id_column = "record_id";
    std::string data_column = "redacted_data_json";
    std::string verdict_column = "is_pii";
};

struct ProcessingConfig {
    int threads = 0;                    // 0 = hardware concurrency (max 4)
    int parallel_threshold = 1000;      // Rows before the batch is split across threads
};

// ============================================================================
// RedactorConfig - Complete parsed configuration
// ============================================================================

struct RedactorConfig {
    LoggingConfig logging;
    InputConfig input;
    OutputConfig output;
    ProcessingConfig processing;
    MaskingConfig masking;
    RuleSet rules = RuleSet::defaults();
};

} // namespace piiredact
