#pragma once

#include "resilience/circuit_breaker_config.hpp"

#include <string>
#include <vector>

namespace siemguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// GuardConfig - Complete parsed configuration
// ============================================================================

struct GuardConfig {
    LoggingConfig logging;
    CircuitBreakerConfig defaults;                  // [circuit_breaker]
    std::vector<NamedBreakerConfig> breakers;       // [circuit_breakers.<name>]
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads breaker configuration from TOML
 *
 *   [logging]
 *   level = "info"
 *
 *   [circuit_breaker]            # defaults for every breaker
 *   failure_threshold = 5
 *   timeout_seconds = 60.0
 *
 *   [circuit_breakers.elasticsearch]
 *   preset = "elasticsearch"     # optional: elasticsearch | wazuh | splunk
 *   failure_threshold = 3        # overrides preset and defaults
 *
 * ${VAR} in string values is replaced from the environment.
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
     * @param config_path Path to the .toml file
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
     * @brief Check every section; one message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);

private:
    static LoadResult validate_and_return(GuardConfig config);
};

} // namespace siemguard
