#include "resilience/health_metrics.hpp"

#include <algorithm>
#include <numeric>

namespace siemguard {

namespace {

double mean_of(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

std::vector<double> to_sorted_seconds(const std::deque<Seconds>& times) {
    std::vector<double> sorted;
    sorted.reserve(times.size());
    for (const auto& t : times) sorted.push_back(t.count());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

// Index int(n * q) of a sorted snapshot
double quantile_at(const std::vector<double>& sorted, double q) {
    auto idx = static_cast<size_t>(static_cast<double>(sorted.size()) * q);
    if (idx >= sorted.size()) idx = sorted.size() - 1;
    return sorted[idx];
}

} // anonymous namespace

HealthMetrics::HealthMetrics(size_t window_size)
    : window_size_(window_size == 0 ? kDefaultWindowSize : window_size) {}

void HealthMetrics::record_success(Seconds response_time, Timestamp now) {
    ++total_requests_;
    ++successful_requests_;
    ++consecutive_successes_;
    consecutive_failures_ = 0;
    last_success_time_ = now;

    response_times_.push_back(response_time);
    while (response_times_.size() > window_size_) {
        response_times_.pop_front();
    }
    update_avg_response_time(response_time.count());
}

void HealthMetrics::record_failure(FailureRecord record) {
    ++total_requests_;
    ++failed_requests_;
    ++consecutive_failures_;
    consecutive_successes_ = 0;
    last_failure_time_ = record.timestamp;

    failure_history_.push_back(std::move(record));
    while (failure_history_.size() > window_size_) {
        failure_history_.pop_front();
    }
}

void HealthMetrics::reset_consecutive() {
    consecutive_successes_ = 0;
    consecutive_failures_ = 0;
}

void HealthMetrics::update_avg_response_time(double seconds) {
    if (avg_response_time_ == 0.0) {
        avg_response_time_ = seconds;
    } else {
        avg_response_time_ = 0.9 * avg_response_time_ + 0.1 * seconds;
    }
}

double HealthMetrics::success_rate() const {
    if (total_requests_ == 0) return 100.0;
    return static_cast<double>(successful_requests_) /
           static_cast<double>(total_requests_) * 100.0;
}

double HealthMetrics::failure_rate() const {
    return 100.0 - success_rate();
}

double HealthMetrics::recent_failure_rate(Timestamp now) const {
    const auto recent_total = std::min<uint64_t>(kRecentRequestWindow, total_requests_);
    if (recent_total == 0) return 0.0;

    const auto recent_failures = std::count_if(
        failure_history_.begin(), failure_history_.end(),
        [&](const FailureRecord& f) { return f.age(now) < kRecentFailureAge; });

    const double rate = static_cast<double>(recent_failures) /
                        static_cast<double>(recent_total) * 100.0;
    return std::min(rate, 100.0);
}

double HealthMetrics::p95_response_time() const {
    if (response_times_.size() < 5) return avg_response_time_;
    return quantile_at(to_sorted_seconds(response_times_), 0.95);
}

uint64_t HealthMetrics::slow_call_count(Seconds threshold) const {
    return static_cast<uint64_t>(std::count_if(
        response_times_.begin(), response_times_.end(),
        [&](const Seconds& rt) { return rt > threshold; }));
}

double HealthMetrics::slow_call_rate(Seconds threshold) const {
    if (response_times_.empty()) return 0.0;
    return static_cast<double>(slow_call_count(threshold)) /
           static_cast<double>(response_times_.size()) * 100.0;
}

std::string HealthMetrics::performance_trend() const {
    const size_t n = response_times_.size();
    if (n < kTrendWindow) return "insufficient_data";

    // Last kTrendWindow samples vs the (up to) kTrendWindow samples before them
    std::vector<double> recent;
    std::vector<double> older;
    const size_t recent_begin = n - kTrendWindow;
    const size_t older_begin = recent_begin > kTrendWindow ? recent_begin - kTrendWindow : 0;
    for (size_t i = older_begin; i < n; ++i) {
        (i < recent_begin ? older : recent).push_back(response_times_[i].count());
    }

    if (older.empty()) return "insufficient_data";

    const double recent_avg = mean_of(recent);
    const double older_avg = mean_of(older);

    if (recent_avg < older_avg * 0.9) return "improving";
    if (recent_avg > older_avg * 1.1) return "degrading";
    return "stable";
}

FailureAnalysis HealthMetrics::failure_analysis(Timestamp now) const {
    FailureAnalysis analysis;
    analysis.total_failures = failure_history_.size();

    // First-seen order breaks ties for most_common_failure
    std::vector<FailureType> seen_order;
    std::vector<RecentFailure> recent;

    for (const auto& f : failure_history_) {
        auto& count = analysis.failure_types[f.failure_type];
        if (count == 0) seen_order.push_back(f.failure_type);
        ++count;

        const Seconds age = f.age(now);
        if (age < kFailureAnalysisAge) {
            RecentFailure rf;
            rf.timestamp = f.timestamp;
            rf.failure_type = f.failure_type;
            rf.message = f.message.substr(0, kMaxMessageLength);
            rf.age_seconds = age.count();
            if (f.response_time) rf.response_time = f.response_time->count();
            rf.http_status = f.http_status;
            recent.push_back(std::move(rf));
        }
    }

    if (recent.size() > kMaxRecentFailures) {
        recent.erase(recent.begin(),
                     recent.end() - static_cast<std::ptrdiff_t>(kMaxRecentFailures));
    }
    analysis.recent_failures = std::move(recent);

    uint64_t best = 0;
    for (const auto type : seen_order) {
        const auto count = analysis.failure_types[type];
        if (count > best) {
            best = count;
            analysis.most_common_failure = type;
        }
    }

    return analysis;
}

PerformanceAnalysis HealthMetrics::performance_analysis(Seconds slow_call_threshold) const {
    PerformanceAnalysis analysis;
    if (response_times_.empty()) return analysis;

    analysis.has_data = true;
    const auto sorted = to_sorted_seconds(response_times_);
    const size_t n = sorted.size();

    auto& stats = analysis.response_time_stats;
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.avg = mean_of(sorted);
    stats.median = (n % 2 == 1) ? sorted[n / 2]
                                : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
    stats.p95 = p95_response_time();
    stats.p99 = n > 10 ? quantile_at(sorted, 0.99) : stats.max;

    analysis.slow_calls.threshold = slow_call_threshold.count();
    analysis.slow_calls.count = slow_call_count(slow_call_threshold);
    analysis.slow_calls.rate = slow_call_rate(slow_call_threshold);

    analysis.trend = performance_trend();
    return analysis;
}

} // namespace siemguard
