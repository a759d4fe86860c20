#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace siemguard {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
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
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

uint32_t read_count(const toml::table& t, std::string_view key, uint32_t fallback,
                    std::string_view path) {
    const auto node = t[key];
    if (!node) return fallback;
    if (!node.is_integer()) {
        throw std::runtime_error(std::format("{}.{} must be an integer", path, key));
    }
    const auto v = node.value_or(int64_t{0});
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
        throw std::runtime_error(std::format("{}.{} out of range: {}", path, key, v));
    }
    return static_cast<uint32_t>(v);
}

Seconds read_seconds(const toml::table& t, std::string_view key, Seconds fallback) {
    // Integers are accepted for durations ("timeout_seconds = 60")
    return Seconds{t[key].value_or(fallback.count())};
}

/**
 * @brief Overlay the keys present in a table onto an existing config
 */
void apply_breaker_table(const toml::table& t, std::string_view path, CircuitBreakerConfig& cfg) {
    cfg.failure_threshold = read_count(t, "failure_threshold", cfg.failure_threshold, path);
    cfg.success_threshold = read_count(t, "success_threshold", cfg.success_threshold, path);
    cfg.minimum_throughput = read_count(t, "minimum_throughput", cfg.minimum_throughput, path);
    cfg.sliding_window_size = read_count(
        t, "sliding_window_size", static_cast<uint32_t>(cfg.sliding_window_size), path);

    cfg.timeout_seconds = read_seconds(t, "timeout_seconds", cfg.timeout_seconds);
    cfg.max_timeout_seconds = read_seconds(t, "max_timeout_seconds", cfg.max_timeout_seconds);
    cfg.slow_call_threshold = read_seconds(t, "slow_call_threshold", cfg.slow_call_threshold);
    cfg.health_check_interval = read_seconds(t, "health_check_interval", cfg.health_check_interval);

    cfg.failure_rate_threshold = t["failure_rate_threshold"].value_or(cfg.failure_rate_threshold);
    cfg.slow_call_rate_threshold = t["slow_call_rate_threshold"].value_or(cfg.slow_call_rate_threshold);
    cfg.recovery_factor = t["recovery_factor"].value_or(cfg.recovery_factor);
    cfg.recovery_increase_factor = t["recovery_increase_factor"].value_or(cfg.recovery_increase_factor);
    cfg.recovery_decrease_factor = t["recovery_decrease_factor"].value_or(cfg.recovery_decrease_factor);

    cfg.exponential_backoff = t["exponential_backoff"].value_or(cfg.exponential_backoff);
    cfg.jitter = t["jitter"].value_or(cfg.jitter);
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CircuitBreakerConfig extract_defaults(const toml::table& root) {
    CircuitBreakerConfig cfg;
    if (const auto* cb = root["circuit_breaker"].as_table()) {
        apply_breaker_table(*cb, "circuit_breaker", cfg);
    }
    return cfg;
}

std::vector<NamedBreakerConfig> extract_breakers(const toml::table& root,
                                                 const CircuitBreakerConfig& defaults) {
    std::vector<NamedBreakerConfig> result;
    const auto* breakers = root["circuit_breakers"].as_table();
    if (!breakers) return result;

    for (auto&& [key, node] : *breakers) {
        const std::string name(key.str());
        const std::string path = "circuit_breakers." + name;
        const auto* t = node.as_table();
        if (!t) {
            throw std::runtime_error(std::format("{} must be a table", path));
        }

        CircuitBreakerConfig cfg = defaults;
        if (const auto preset = (*t)["preset"].value<std::string>()) {
            auto resolved = presets::by_name(*preset, defaults);
            if (!resolved) {
                throw std::runtime_error(
                    std::format("{}.preset: unknown preset '{}'", path, *preset));
            }
            cfg = *resolved;
        }
        apply_breaker_table(*t, path, cfg);

        result.push_back(NamedBreakerConfig{name, std::move(cfg)});
    }
    return result;
}

GuardConfig extract_all_sections(const toml::table& root) {
    GuardConfig config;
    config.logging = extract_logging(root);
    config.defaults = extract_defaults(root);
    config.breakers = extract_breakers(root, config.defaults);
    return config;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

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

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    auto defaults_errors = siemguard::validate_config(config.defaults, "circuit_breaker");
    errors.insert(errors.end(), defaults_errors.begin(), defaults_errors.end());

    for (const auto& entry : config.breakers) {
        if (entry.name.empty()) {
            errors.push_back("circuit_breakers: breaker name must not be empty");
            continue;
        }
        auto breaker_errors = siemguard::validate_config(entry.config, "circuit_breakers." + entry.name);
        errors.insert(errors.end(), breaker_errors.begin(), breaker_errors.end());
    }

    return errors;
}

} // namespace siemguard
