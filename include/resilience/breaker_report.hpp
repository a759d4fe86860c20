#pragma once

#include "resilience/circuit_breaker.hpp"
#include "resilience/circuit_breaker_manager.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace siemguard {

// ============================================================================
// JSON rendering for the observability layer
//
// nlohmann ADL hooks: `nlohmann::json j = breaker.get_state();`
// Timestamps are epoch seconds, absent optionals are null.
// ============================================================================

void to_json(nlohmann::json& j, const CircuitBreakerConfig& config);
void to_json(nlohmann::json& j, const BreakerSnapshot& snapshot);
void to_json(nlohmann::json& j, const StateChangeEvent& event);
void to_json(nlohmann::json& j, const FailureAnalysis& analysis);
void to_json(nlohmann::json& j, const PerformanceAnalysis& analysis);
void to_json(nlohmann::json& j, const BreakerCounts& counts);
void to_json(nlohmann::json& j, const GlobalStatus& status);

/**
 * @brief Full per-breaker report: state, failure and performance analysis,
 *        recent transitions
 */
[[nodiscard]] nlohmann::json breaker_report(const CircuitBreaker& breaker);

/**
 * @brief Global status serialized as a JSON string
 * @param indent -1 for compact output
 */
[[nodiscard]] std::string global_status_json(const CircuitBreakerManager& manager, int indent = -1);

} // namespace siemguard
