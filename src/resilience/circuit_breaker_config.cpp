#include "resilience/circuit_breaker_config.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace siemguard {

namespace {

bool positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

// (low, high]
bool in_range(double value, double low, double high) {
    return std::isfinite(value) && value > low && value <= high;
}

} // anonymous namespace

std::vector<std::string> validate_config(const CircuitBreakerConfig& config, std::string_view prefix) {
    std::vector<std::string> errors;

    if (config.failure_threshold == 0) {
        errors.push_back(std::format("{}.failure_threshold must be > 0", prefix));
    }
    if (config.success_threshold == 0) {
        errors.push_back(std::format("{}.success_threshold must be > 0", prefix));
    }
    if (!positive(config.timeout_seconds.count())) {
        errors.push_back(std::format("{}.timeout_seconds must be finite and > 0", prefix));
    }
    if (!positive(config.max_timeout_seconds.count())) {
        errors.push_back(std::format("{}.max_timeout_seconds must be finite and > 0", prefix));
    } else if (config.max_timeout_seconds < config.timeout_seconds) {
        errors.push_back(std::format(
            "{}.max_timeout_seconds ({}) < timeout_seconds ({})",
            prefix, config.max_timeout_seconds.count(), config.timeout_seconds.count()));
    }
    if (!in_range(config.failure_rate_threshold, 0.0, 100.0)) {
        errors.push_back(std::format("{}.failure_rate_threshold must be in (0, 100]", prefix));
    }
    if (!positive(config.slow_call_threshold.count())) {
        errors.push_back(std::format("{}.slow_call_threshold must be finite and > 0", prefix));
    }
    if (!in_range(config.slow_call_rate_threshold, 0.0, 100.0)) {
        errors.push_back(std::format("{}.slow_call_rate_threshold must be in (0, 100]", prefix));
    }
    if (config.sliding_window_size == 0) {
        errors.push_back(std::format("{}.sliding_window_size must be > 0", prefix));
    }
    if (!positive(config.health_check_interval.count())) {
        errors.push_back(std::format("{}.health_check_interval must be finite and > 0", prefix));
    }
    if (!in_range(config.recovery_factor, 0.0, 1.0)) {
        errors.push_back(std::format("{}.recovery_factor must be in (0, 1]", prefix));
    }
    if (!std::isfinite(config.recovery_increase_factor) || config.recovery_increase_factor < 1.0) {
        errors.push_back(std::format("{}.recovery_increase_factor must be finite and >= 1", prefix));
    }
    // A zero factor would leave HALF_OPEN admitting nothing
    if (!in_range(config.recovery_decrease_factor, 0.0, 1.0)) {
        errors.push_back(std::format("{}.recovery_decrease_factor must be in (0, 1]", prefix));
    }

    return errors;
}

namespace presets {

CircuitBreakerConfig elasticsearch() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 3;
    cfg.success_threshold = 2;
    cfg.timeout_seconds = Seconds{30.0};
    cfg.failure_rate_threshold = 30.0;
    cfg.slow_call_threshold = Seconds{5.0};
    cfg.minimum_throughput = 5;
    return cfg;
}

CircuitBreakerConfig wazuh() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 5;
    cfg.success_threshold = 3;
    cfg.timeout_seconds = Seconds{60.0};
    cfg.failure_rate_threshold = 40.0;
    cfg.slow_call_threshold = Seconds{10.0};
    cfg.minimum_throughput = 5;
    return cfg;
}

CircuitBreakerConfig splunk() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 4;
    cfg.success_threshold = 3;
    cfg.timeout_seconds = Seconds{45.0};
    cfg.failure_rate_threshold = 35.0;
    cfg.slow_call_threshold = Seconds{8.0};
    cfg.minimum_throughput = 5;
    return cfg;
}

std::optional<CircuitBreakerConfig> by_name(std::string_view name, const CircuitBreakerConfig& base) {
    const std::string lower = utils::to_lower(name);

    std::optional<CircuitBreakerConfig> preset;
    if (lower == "elasticsearch") preset = elasticsearch();
    else if (lower == "wazuh") preset = wazuh();
    else if (lower == "splunk") preset = splunk();
    if (!preset) return std::nullopt;

    CircuitBreakerConfig cfg = base;
    cfg.failure_threshold = preset->failure_threshold;
    cfg.success_threshold = preset->success_threshold;
    cfg.timeout_seconds = preset->timeout_seconds;
    cfg.failure_rate_threshold = preset->failure_rate_threshold;
    cfg.slow_call_threshold = preset->slow_call_threshold;
    cfg.minimum_throughput = preset->minimum_throughput;
    return cfg;
}

} // namespace presets

} // namespace siemguard
