#pragma once

#include "config/config_types.hpp"
#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads pii_guard.toml
 *
 * String values may reference the environment as ${VAR}; an unset variable
 * expands to the empty string, an unclosed "${" is a load error.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
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
     * @param config_path Path to pii_guard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per violated constraint, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);

private:
    static LoadResult validate_and_return(GuardConfig config);
};

} // namespace piiguard
