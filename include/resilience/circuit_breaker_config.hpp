#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siemguard {

/**
 * @brief Thresholds and timings for one circuit breaker
 *
 * Rates are percentages (0-100]. Durations are fractional seconds.
 */
struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;             // Consecutive failures to trip OPEN
    uint32_t success_threshold = 3;             // Consecutive successes to close from HALF_OPEN
    Seconds timeout_seconds{60.0};              // Base OPEN cooldown
    Seconds max_timeout_seconds{300.0};         // Backoff ceiling
    double failure_rate_threshold = 50.0;       // Lifetime failure % to trip OPEN
    Seconds slow_call_threshold{10.0};          // Calls slower than this count as slow
    double slow_call_rate_threshold = 50.0;     // Slow call % (retained window) to trip OPEN
    uint32_t minimum_throughput = 10;           // Requests before any evaluation
    size_t sliding_window_size = 100;           // Response-time / failure ring capacity

    bool exponential_backoff = true;            // Double the backoff on every OPEN
    bool jitter = true;                         // Scale cooldown by U[0.8, 1.2]
    Seconds health_check_interval{30.0};        // Background check period while OPEN

    // Gradual (canary) recovery after a HALF_OPEN transition on busy breakers
    double recovery_factor = 0.1;               // Initial admission probability
    double recovery_increase_factor = 1.1;      // Applied on each success
    double recovery_decrease_factor = 0.5;      // Applied on each failure
};

/**
 * @brief A breaker name with its resolved config (from the config file)
 */
struct NamedBreakerConfig {
    std::string name;
    CircuitBreakerConfig config;
};

/**
 * @brief Check a config; returns one message per problem (empty = valid)
 * @param prefix Key path prepended to each message, e.g. "circuit_breakers.wazuh"
 */
[[nodiscard]] std::vector<std::string> validate_config(
    const CircuitBreakerConfig& config, std::string_view prefix = "circuit_breaker");

// ============================================================================
// Presets for the SIEM connectors
// ============================================================================

namespace presets {

/// Elasticsearch: fails fast, short cooldown
[[nodiscard]] CircuitBreakerConfig elasticsearch();

[[nodiscard]] CircuitBreakerConfig wazuh();

[[nodiscard]] CircuitBreakerConfig splunk();

/**
 * @brief Look up a preset by name ("elasticsearch", "wazuh", "splunk")
 * @param base Non-preset fields are taken from base
 */
[[nodiscard]] std::optional<CircuitBreakerConfig> by_name(
    std::string_view name, const CircuitBreakerConfig& base = {});

} // namespace presets

} // namespace siemguard
