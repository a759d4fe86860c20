#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace siemguard {

/**
 * @brief Record of one failed call
 */
struct FailureRecord {
    Timestamp timestamp;
    FailureType failure_type = FailureType::UNKNOWN;
    std::string message;
    std::optional<Seconds> response_time;
    std::optional<int> http_status;

    /// Age relative to now, computed lazily on read
    [[nodiscard]] Seconds age(Timestamp now) const {
        return std::chrono::duration_cast<Seconds>(now - timestamp);
    }
};

struct RecentFailure {
    Timestamp timestamp;
    FailureType failure_type = FailureType::UNKNOWN;
    std::string message;            // Truncated to kMaxMessageLength
    double age_seconds = 0.0;
    std::optional<double> response_time;
    std::optional<int> http_status;
};

struct FailureAnalysis {
    std::map<FailureType, uint64_t> failure_types;
    uint64_t total_failures = 0;    // Failures still in the retained window
    std::vector<RecentFailure> recent_failures;
    std::optional<FailureType> most_common_failure;
};

struct ResponseTimeStats {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double median = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

struct SlowCallStats {
    double threshold = 0.0;
    uint64_t count = 0;
    double rate = 0.0;
};

struct PerformanceAnalysis {
    bool has_data = false;          // false when no response time was recorded yet
    ResponseTimeStats response_time_stats;
    SlowCallStats slow_calls;
    std::string trend = "insufficient_data";
};

/**
 * @brief Bounded rolling-window health recorder for one breaker
 *
 * Response times (successful calls) and failure records are kept in rings
 * of window_size entries; counts are lifetime totals. Incrementing one
 * consecutive counter zeroes the other.
 *
 * Not thread-safe: the owning CircuitBreaker serializes access under its
 * own mutex.
 */
class HealthMetrics {
public:
    static constexpr size_t kDefaultWindowSize = 100;
    static constexpr size_t kMaxRecentFailures = 10;
    static constexpr size_t kMaxMessageLength = 100;
    static constexpr size_t kRecentRequestWindow = 50;
    static constexpr Seconds kRecentFailureAge{300.0};
    static constexpr Seconds kFailureAnalysisAge{600.0};
    static constexpr size_t kTrendWindow = 10;

    explicit HealthMetrics(size_t window_size = kDefaultWindowSize);

    void record_success(Seconds response_time, Timestamp now);
    void record_failure(FailureRecord record);

    /// Zero both consecutive counters (state transitions, manual reset)
    void reset_consecutive();

    [[nodiscard]] uint64_t total_requests() const { return total_requests_; }
    [[nodiscard]] uint64_t successful_requests() const { return successful_requests_; }
    [[nodiscard]] uint64_t failed_requests() const { return failed_requests_; }
    [[nodiscard]] uint64_t consecutive_successes() const { return consecutive_successes_; }
    [[nodiscard]] uint64_t consecutive_failures() const { return consecutive_failures_; }
    [[nodiscard]] std::optional<Timestamp> last_success_time() const { return last_success_time_; }
    [[nodiscard]] std::optional<Timestamp> last_failure_time() const { return last_failure_time_; }
    [[nodiscard]] const std::deque<Seconds>& response_times() const { return response_times_; }
    [[nodiscard]] const std::deque<FailureRecord>& failure_history() const { return failure_history_; }
    [[nodiscard]] size_t window_size() const { return window_size_; }

    /// Percent; 100 when nothing has been recorded
    [[nodiscard]] double success_rate() const;
    [[nodiscard]] double failure_rate() const;

    /// Failures younger than 5 minutes over min(50, total), percent, capped at 100
    [[nodiscard]] double recent_failure_rate(Timestamp now) const;

    /// Exponential moving average (alpha = 0.1), seconds
    [[nodiscard]] double avg_response_time() const { return avg_response_time_; }

    /// Falls back to the moving average with fewer than 5 samples
    [[nodiscard]] double p95_response_time() const;

    [[nodiscard]] uint64_t slow_call_count(Seconds threshold) const;

    /// Percent of the retained response-time window above threshold
    [[nodiscard]] double slow_call_rate(Seconds threshold) const;

    /// "improving" / "degrading" / "stable" / "insufficient_data"
    [[nodiscard]] std::string performance_trend() const;

    [[nodiscard]] FailureAnalysis failure_analysis(Timestamp now) const;
    [[nodiscard]] PerformanceAnalysis performance_analysis(Seconds slow_call_threshold) const;

private:
    void update_avg_response_time(double seconds);

    size_t window_size_;

    uint64_t total_requests_ = 0;
    uint64_t successful_requests_ = 0;
    uint64_t failed_requests_ = 0;
    uint64_t consecutive_successes_ = 0;
    uint64_t consecutive_failures_ = 0;
    double avg_response_time_ = 0.0;

    std::deque<Seconds> response_times_;
    std::deque<FailureRecord> failure_history_;

    std::optional<Timestamp> last_success_time_;
    std::optional<Timestamp> last_failure_time_;
};

} // namespace siemguard
