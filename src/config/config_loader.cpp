#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace piiredact {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

// Field-role name in [rules.aliases] -> member of FieldAliases
constexpr std::array<std::pair<std::string_view, AliasSet FieldAliases::*>, 15> kAliasRoles = {{
    {"phone",       &FieldAliases::phone},
    {"aadhaar",     &FieldAliases::aadhaar},
    {"passport",    &FieldAliases::passport},
    {"upi",         &FieldAliases::upi},
    {"ip",          &FieldAliases::ip},
    {"name",        &FieldAliases::name},
    {"first_name",  &FieldAliases::first_name},
    {"last_name",   &FieldAliases::last_name},
    {"email",       &FieldAliases::email},
    {"address",     &FieldAliases::address},
    {"city",        &FieldAliases::city},
    {"postal_code", &FieldAliases::postal_code},
    {"device",      &FieldAliases::device},
    {"latitude",    &FieldAliases::latitude},
    {"longitude",   &FieldAliases::longitude},
}};

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

AliasSet toml_lower_set(const toml::table& tbl, const std::string_view key) {
    AliasSet result;
    for (const auto& s : toml_string_array(tbl, key)) {
        result.insert(utils::to_lower(utils::trim(s)));
    }
    return result;
}

// Single-character settings; '\0' marks an invalid value for validate_config()
char single_char(const std::string& value) {
    return value.size() == 1 ? value[0] : '\0';
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;
    const auto& in = *input;

    cfg.record_id_column = in["record_id_column"].value_or(cfg.record_id_column);
    if (in["data_columns"].is_array()) {
        cfg.data_columns = toml_string_array(in, "data_columns");
    }
    if (const auto delim = in["delimiter"].value<std::string>()) {
        cfg.delimiter = single_char(*delim);
    }
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& out = *output;

    cfg.file             = out["file"].value_or(cfg.file);
    cfg.record_id_column = out["record_id_column"].value_or(cfg.record_id_column);
    cfg.data_column      = out["data_column"].value_or(cfg.data_column);
    cfg.verdict_column   = out["verdict_column"].value_or(cfg.verdict_column);
    return cfg;
}

ProcessingConfig ConfigLoader::extract_processing(const toml::table& root) {
    ProcessingConfig cfg;
    const auto* processing = root["processing"].as_table();
    if (!processing) return cfg;
    const auto& p = *processing;

    cfg.threads = p["threads"].value_or(cfg.threads);
    cfg.parallel_threshold = p["parallel_threshold"].value_or(cfg.parallel_threshold);
    return cfg;
}

MaskingConfig ConfigLoader::extract_masking(const toml::table& root) {
    MaskingConfig cfg;
    const auto* masking = root["masking"].as_table();
    if (!masking) return cfg;
    const auto& m = *masking;

    if (const auto fill = m["fill_char"].value<std::string>()) {
        cfg.fill_char = single_char(*fill);
    }

    if (const auto* sentinels = m["sentinels"].as_table()) {
        const auto& s = *sentinels;
        cfg.address_sentinel  = s["address"].value_or(cfg.address_sentinel);
        cfg.ip_sentinel       = s["ip"].value_or(cfg.ip_sentinel);
        cfg.device_sentinel   = s["device"].value_or(cfg.device_sentinel);
        cfg.location_sentinel = s["location"].value_or(cfg.location_sentinel);
        cfg.generic_sentinel  = s["generic"].value_or(cfg.generic_sentinel);
    }
    return cfg;
}

RuleSet ConfigLoader::extract_rules(const toml::table& root) {
    RuleSet rules = RuleSet::defaults();
    const auto* section = root["rules"].as_table();
    if (!section) return rules;
    const auto& r = *section;

    rules.luhn_check = r["luhn_check"].value_or(rules.luhn_check);
    rules.ip_standalone = r["ip_standalone"].value_or(rules.ip_standalone);
    rules.split_device_and_location =
        r["split_device_and_location"].value_or(rules.split_device_and_location);

    if (r["upi_providers"].is_array()) {
        rules.upi_providers = toml_lower_set(r, "upi_providers");
    }

    // Each listed role replaces the built-in alias set for that role
    if (const auto* aliases = r["aliases"].as_table()) {
        for (const auto& [role, member] : kAliasRoles) {
            if ((*aliases)[role].is_array()) {
                rules.aliases.*member = toml_lower_set(*aliases, role);
            }
        }
    }
    return rules;
}

// ---- Shared extraction + validation ----------------------------------------

RedactorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    RedactorConfig config;
    config.logging = extract_logging(tbl);
    config.input = extract_input(tbl);
    config.output = extract_output(tbl);
    config.processing = extract_processing(tbl);
    config.masking = extract_masking(tbl);
    config.rules = extract_rules(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RedactorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RedactorConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    if (config.input.record_id_column.empty()) {
        errors.push_back("input.record_id_column must not be empty");
    }
    if (config.input.data_columns.empty()) {
        errors.push_back("input.data_columns must list at least one column");
    }
    if (config.input.delimiter == '\0' || config.input.delimiter == '"' ||
        config.input.delimiter == '\n') {
        errors.push_back("input.delimiter must be a single character other than a quote");
    }

    if (config.output.file.empty()) {
        errors.push_back("output.file must not be empty");
    }
    if (config.output.record_id_column.empty() || config.output.data_column.empty() ||
        config.output.verdict_column.empty()) {
        errors.push_back("output column names must not be empty");
    }

    if (config.processing.threads < 0) {
        errors.push_back(std::format("processing.threads must be >= 0, got {}",
            config.processing.threads));
    }
    if (config.processing.parallel_threshold < 1) {
        errors.push_back(std::format("processing.parallel_threshold must be >= 1, got {}",
            config.processing.parallel_threshold));
    }

    // A digit fill would be indistinguishable from the kept digits of a masked number
    const char fill = config.masking.fill_char;
    if (fill == '\0' || utils::is_digit(fill) || utils::is_space(fill)) {
        errors.push_back("masking.fill_char must be a single character that is not a digit or whitespace");
    }
    const std::array<std::pair<std::string_view, const std::string*>, 5> sentinels = {{
        {"address",  &config.masking.address_sentinel},
        {"ip",       &config.masking.ip_sentinel},
        {"device",   &config.masking.device_sentinel},
        {"location", &config.masking.location_sentinel},
        {"generic",  &config.masking.generic_sentinel},
    }};
    for (const auto& [name, value] : sentinels) {
        if (value->empty()) {
            errors.push_back(std::format("masking.sentinels.{} must not be empty", name));
        }
    }

    for (const auto& [role, member] : kAliasRoles) {
        if ((config.rules.aliases.*member).empty()) {
            errors.push_back(std::format("rules.aliases.{} must not be empty", role));
        }
    }

    return errors;
}

} // namespace piiredact
