#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace siemguard {

/**
 * @brief Thrown by CircuitBreaker::call() when a request is not admitted
 *
 * A control-flow signal, not a failure of the protected service: the
 * operation was never invoked. Callers apply their own fallback.
 */
class CircuitOpenError : public std::runtime_error {
public:
    CircuitOpenError(std::string breaker_name, double retry_after_seconds)
        : std::runtime_error(std::format(
              "Circuit breaker is OPEN for {}. Next attempt in {:.1f} seconds",
              breaker_name, retry_after_seconds)),
          breaker_name_(std::move(breaker_name)),
          retry_after_seconds_(retry_after_seconds) {}

    [[nodiscard]] const std::string& breaker_name() const noexcept { return breaker_name_; }

    /// Remaining cooldown; 0 when rejected by HALF_OPEN canary gating
    [[nodiscard]] double retry_after_seconds() const noexcept { return retry_after_seconds_; }

private:
    std::string breaker_name_;
    double retry_after_seconds_;
};

/**
 * @brief Error raised by connectors for an HTTP response with a failure status
 *
 * The failure classifier reads status_code() to categorize the failure.
 */
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    [[nodiscard]] int status_code() const noexcept { return status_code_; }

private:
    int status_code_;
};

} // namespace siemguard
