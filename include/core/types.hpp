#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace siemguard {

// ============================================================================
// Time
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

// Fractional seconds; every breaker duration (config and measurement) uses it
using Seconds = std::chrono::duration<double>;

// Source of "now" for a breaker. Tests substitute a manual clock.
using TimeSource = std::function<Timestamp()>;

[[nodiscard]] inline double to_epoch_seconds(Timestamp tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Circuit Breaker Enums
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Testing recovery
};

enum class FailureType {
    TIMEOUT,
    CONNECTION_ERROR,
    AUTHENTICATION_ERROR,
    RATE_LIMIT,
    SERVICE_UNAVAILABLE,
    HTTP_ERROR,
    UNKNOWN
};

[[nodiscard]] inline constexpr const char* circuit_state_str(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

[[nodiscard]] inline constexpr const char* failure_type_str(FailureType t) {
    switch (t) {
        case FailureType::TIMEOUT:              return "timeout";
        case FailureType::CONNECTION_ERROR:     return "connection_error";
        case FailureType::AUTHENTICATION_ERROR: return "auth_error";
        case FailureType::RATE_LIMIT:           return "rate_limit";
        case FailureType::SERVICE_UNAVAILABLE:  return "service_unavailable";
        case FailureType::HTTP_ERROR:           return "http_error";
        case FailureType::UNKNOWN:              return "unknown_error";
    }
    return "unknown_error";
}

// ============================================================================
// State Change Event
// ============================================================================

/**
 * @brief Metrics captured at the moment of a transition (for postmortems)
 */
struct MetricsAtTransition {
    uint64_t total_requests = 0;
    double success_rate = 100.0;
    double failure_rate = 0.0;
    double avg_response_time = 0.0;
    uint64_t consecutive_failures = 0;
};

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from = CircuitState::CLOSED;
    CircuitState to = CircuitState::CLOSED;
    Timestamp timestamp{};
    std::string breaker_name;
    std::string reason;
    MetricsAtTransition metrics;
};

} // namespace siemguard
