#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace piiredact {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads redactor.toml
 *
 * - ${VAR} in any string is replaced by the environment value (empty when
 *   unset; an unclosed "${" is an error)
 * - include = "file.toml" or include = ["a.toml", "b.toml"] pulls in other
 *   files relative to the including file; the including file wins for
 *   scalars, arrays are concatenated, depth is limited to 10 and cycles are
 *   rejected
 * - Missing sections and keys keep their defaults
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to redactor.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not resolved)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation errors for a config (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static InputConfig extract_input(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);
    static ProcessingConfig extract_processing(const toml::table& root);
    static MaskingConfig extract_masking(const toml::table& root);
    static RuleSet extract_rules(const toml::table& root);

    static RedactorConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RedactorConfig config);
};

} // namespace piiredact
