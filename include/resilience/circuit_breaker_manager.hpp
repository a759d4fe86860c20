#pragma once

#include "resilience/circuit_breaker.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace siemguard {

/**
 * @brief Number of registered breakers per state
 */
struct BreakerCounts {
    uint64_t total_breakers = 0;
    uint64_t open_breakers = 0;
    uint64_t half_open_breakers = 0;
    uint64_t closed_breakers = 0;
};

struct HealthSummary {
    double healthy_percentage = 0.0;    // closed / max(1, total) * 100
    uint64_t degraded_count = 0;        // HALF_OPEN
    uint64_t failed_count = 0;          // OPEN
};

struct GlobalStatus {
    BreakerCounts global_stats;
    std::map<std::string, BreakerSnapshot> breakers;
    HealthSummary health_summary;
};

/**
 * @brief Named registry and factory of circuit breakers
 *
 * Owned by the application's composition root and passed by reference to
 * the connectors; there is no process-wide instance.
 *
 * The manager installs itself as every breaker's on_state_change handler
 * and keeps per-state counts (counts()) from those events alone. Events from
 * a breaker that is no longer registered (after cleanup_all) are ignored.
 * get_global_status() counts the states of the snapshots it returns.
 *
 * Lookups take a shared lock; creation and count updates a unique lock.
 */
class CircuitBreakerManager {
public:
    /**
     * @param default_config Config for create_breaker(name) without one
     * @param clock Time source handed to every breaker (system clock when empty)
     * @param classifier Failure classifier shared by every breaker
     */
    explicit CircuitBreakerManager(CircuitBreakerConfig default_config = {},
                                   TimeSource clock = {},
                                   std::shared_ptr<const FailureClassifier> classifier = nullptr);

    ~CircuitBreakerManager();

    CircuitBreakerManager(const CircuitBreakerManager&) = delete;
    CircuitBreakerManager& operator=(const CircuitBreakerManager&) = delete;

    /**
     * @brief Create a breaker, or return the existing one with that name
     *
     * An existing breaker keeps its original config; a warning is logged.
     * @return Shared pointer to the breaker (never null)
     */
    std::shared_ptr<CircuitBreaker> create_breaker(const std::string& name);
    std::shared_ptr<CircuitBreaker> create_breaker(const std::string& name,
                                                   const CircuitBreakerConfig& config);

    /**
     * @brief Create every breaker listed in the config file
     * @return Number of breakers newly created
     */
    size_t create_configured(const std::vector<NamedBreakerConfig>& configs);

    /**
     * @brief Non-throwing lookup
     * @return nullptr when no breaker has that name
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& name) const;

    [[nodiscard]] GlobalStatus get_global_status() const;

    [[nodiscard]] BreakerCounts counts() const;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const;

    void reset_all();

    /**
     * @brief Stop every breaker's health check, detach, clear the registry
     */
    void cleanup_all();

    [[nodiscard]] const CircuitBreakerConfig& default_config() const { return default_config_; }

private:
    void on_state_change(const CircuitBreaker* breaker, const StateChangeEvent& event);

    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> snapshot_breakers() const;

    CircuitBreakerConfig default_config_;
    TimeSource clock_;
    std::shared_ptr<const FailureClassifier> classifier_;

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    BreakerCounts counts_;
    mutable std::shared_mutex mutex_;
};

// ============================================================================
// SIEM connector helpers
// ============================================================================

std::shared_ptr<CircuitBreaker> create_elasticsearch_breaker(CircuitBreakerManager& manager);
std::shared_ptr<CircuitBreaker> create_wazuh_breaker(CircuitBreakerManager& manager);
std::shared_ptr<CircuitBreaker> create_splunk_breaker(CircuitBreakerManager& manager);

} // namespace siemguard
