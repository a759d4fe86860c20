#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "resilience/circuit_breaker_config.hpp"
#include "resilience/failure_classifier.hpp"
#include "resilience/health_metrics.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace siemguard {

/**
 * @brief Point-in-time view of a breaker (for the observability layer)
 */
struct BreakerSnapshot {
    struct Metrics {
        uint64_t total_requests = 0;
        uint64_t successful_requests = 0;
        uint64_t failed_requests = 0;
        double success_rate = 100.0;
        double failure_rate = 0.0;
        double avg_response_time = 0.0;
        double p95_response_time = 0.0;
        uint64_t consecutive_failures = 0;
        uint64_t consecutive_successes = 0;
        std::optional<Timestamp> last_success_time;
        std::optional<Timestamp> last_failure_time;
        double recent_failure_rate = 0.0;
    };

    struct Recovery {
        bool recovery_mode = false;
        double gradual_recovery_rate = 1.0;
        double backoff_multiplier = 1.0;
    };

    std::string name;
    CircuitState state = CircuitState::CLOSED;
    double state_duration = 0.0;    // Seconds since the last transition
    double next_attempt_in = 0.0;   // Seconds; 0 unless OPEN
    Metrics metrics;
    CircuitBreakerConfig config;
    Recovery recovery;
};

/**
 * @brief Adaptive circuit breaker for calls to an external service
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately with CircuitOpenError
 * - HALF_OPEN:  Testing recovery; on busy breakers (> 1000 lifetime requests)
 *               only a growing fraction of requests is admitted (canary)
 *
 * State transitions:
 * - CLOSED → OPEN:      after minimum_throughput requests, when consecutive
 *                       failures, lifetime failure rate or slow call rate
 *                       cross their thresholds (evaluated on each failure)
 * - OPEN → HALF_OPEN:   first admission at or after next_attempt_time
 * - HALF_OPEN → CLOSED: success_threshold consecutive successes
 * - HALF_OPEN → OPEN:   same evaluation as CLOSED → OPEN
 *
 * Every OPEN episode waits min(timeout * backoff_multiplier, max_timeout),
 * optionally jittered by ±20%; with exponential backoff the multiplier
 * doubles per episode and returns to 1.0 only on CLOSED.
 *
 * Thread-safety: state and metrics are guarded by a per-breaker mutex.
 * Handlers run outside that mutex, one at a time, and state-change events
 * are delivered in transition order. A handler may replace any handler of
 * the same breaker; the replacement applies from the next delivery.
 */
class CircuitBreaker {
public:
    using SuccessHandler = std::function<void(Seconds response_time, bool slow_call)>;
    using FailureHandler = std::function<void(const FailureRecord& record)>;
    using StateChangeHandler = std::function<void(const StateChangeEvent& event)>;

    static constexpr size_t kMaxRecentEvents = 100;

    // Lifetime requests above which HALF_OPEN uses gradual recovery
    static constexpr uint64_t kGradualRecoveryMinRequests = 1000;

    /**
     * @brief Construct circuit breaker
     * @param name Circuit breaker identifier
     * @param config Thresholds and timings
     * @param clock Time source (system clock when empty)
     * @param classifier Shared failure classifier (default rules when null)
     */
    explicit CircuitBreaker(std::string name,
                            CircuitBreakerConfig config = {},
                            TimeSource clock = {},
                            std::shared_ptr<const FailureClassifier> classifier = nullptr);

    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run an operation through the breaker
     *
     * Rejected requests throw CircuitOpenError without invoking fn. An
     * exception thrown by fn is classified, recorded and rethrown unchanged.
     * No timeout is imposed on fn.
     */
    template<typename Fn, typename... Args>
    std::invoke_result_t<Fn, Args...> call(Fn&& fn, Args&&... args) {
        using Result = std::invoke_result_t<Fn, Args...>;

        if (!allow_request()) {
            throw CircuitOpenError(name_, next_attempt_in());
        }

        const utils::Timer timer;
        if constexpr (std::is_void_v<Result>) {
            invoke_recording_failure(timer, std::forward<Fn>(fn), std::forward<Args>(args)...);
            record_success(timer.elapsed<Seconds>());
        } else {
            Result result = invoke_recording_failure(
                timer, std::forward<Fn>(fn), std::forward<Args>(args)...);
            record_success(timer.elapsed<Seconds>());
            return result;
        }
    }

    /**
     * @brief Admission check; may move OPEN → HALF_OPEN as a side effect
     * @return true if the request may proceed
     */
    bool allow_request();

    /**
     * @brief Record a successful operation
     */
    void record_success(Seconds response_time);

    /**
     * @brief Record a failed operation from the raised exception
     */
    void record_failure(const std::exception_ptr& error,
                        std::optional<Seconds> response_time = std::nullopt);

    /**
     * @brief Record a failure the caller has already categorized
     *        (e.g. an HTTP error response that did not raise)
     */
    void record_failure(FailureType type,
                        std::string message,
                        std::optional<Seconds> response_time = std::nullopt,
                        std::optional<int> http_status = std::nullopt);

    [[nodiscard]] CircuitState state() const;

    /// Seconds until OPEN admits the next request (0 unless OPEN)
    [[nodiscard]] double next_attempt_in() const;

    [[nodiscard]] BreakerSnapshot get_state() const;
    [[nodiscard]] FailureAnalysis get_failure_analysis() const;
    [[nodiscard]] PerformanceAnalysis get_performance_analysis() const;

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

    /**
     * @brief Force CLOSED; clears backoff and recovery, keeps cumulative metrics
     */
    void reset();

    /**
     * @brief Administrative OPEN, bypassing evaluation (no-op when OPEN)
     */
    void force_open(const std::string& reason = "Manual override");

    /**
     * @brief Stop the background health check; idempotent
     */
    void cleanup();

    [[nodiscard]] bool health_check_active() const {
        return health_check_active_.load(std::memory_order_acquire);
    }

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

    void set_on_success(SuccessHandler handler);
    void set_on_failure(FailureHandler handler);
    void set_on_state_change(StateChangeHandler handler);

private:
    template<typename Fn, typename... Args>
    decltype(auto) invoke_recording_failure(const utils::Timer& timer, Fn&& fn, Args&&... args) {
        try {
            return std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
        } catch (...) {
            record_failure(std::current_exception(), timer.elapsed<Seconds>());
            throw;
        }
    }

    [[nodiscard]] Timestamp now() const { return clock_(); }

    void record_failure_record(FailureRecord record);

    // ---- Require mutex_ held ----
    bool evaluate_circuit_state(Timestamp now);
    bool transition_to_open(const std::string& reason, Timestamp now);
    void transition_to_half_open(Timestamp now);
    void transition_to_closed(Timestamp now);
    void record_state_change(CircuitState from, CircuitState to,
                             std::string reason, Timestamp now);
    [[nodiscard]] double time_until_next_attempt(Timestamp now) const;

    // ---- Require mutex_ NOT held ----
    void after_update(bool opened);
    void dispatch_pending_events();
    void start_health_check();
    void stop_health_check();
    void health_check_loop(std::stop_token stop, uint64_t episode);

    std::string name_;
    const CircuitBreakerConfig config_;
    TimeSource clock_;
    std::shared_ptr<const FailureClassifier> classifier_;

    mutable std::mutex mutex_;
    HealthMetrics metrics_;
    CircuitState state_ = CircuitState::CLOSED;
    Timestamp state_changed_time_;
    Timestamp next_attempt_time_{};
    double backoff_multiplier_ = 1.0;
    bool recovery_mode_ = false;
    double gradual_recovery_rate_ = 1.0;
    uint64_t open_episode_ = 0;
    std::deque<StateChangeEvent> recent_events_;
    std::deque<StateChangeEvent> pending_events_;

    // Handlers; dispatch_mutex_ serializes delivery
    std::recursive_mutex dispatch_mutex_;
    SuccessHandler on_success_;
    FailureHandler on_failure_;
    StateChangeHandler on_state_change_;

    // Background health check (one per OPEN episode)
    std::condition_variable_any state_cv_;
    std::mutex health_mutex_;
    std::atomic<bool> health_check_active_{false};
    std::jthread health_thread_;
};

} // namespace siemguard
