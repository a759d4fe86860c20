#include "resilience/breaker_report.hpp"

namespace siemguard {

using json = nlohmann::json;

namespace {

json optional_time(const std::optional<Timestamp>& tp) {
    return tp ? json(to_epoch_seconds(*tp)) : json(nullptr);
}

template<typename T>
json optional_value(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

} // anonymous namespace

void to_json(json& j, const CircuitBreakerConfig& config) {
    j = json{
        {"failure_threshold", config.failure_threshold},
        {"success_threshold", config.success_threshold},
        {"timeout_seconds", config.timeout_seconds.count()},
        {"max_timeout_seconds", config.max_timeout_seconds.count()},
        {"failure_rate_threshold", config.failure_rate_threshold},
        {"slow_call_threshold", config.slow_call_threshold.count()},
        {"slow_call_rate_threshold", config.slow_call_rate_threshold},
        {"minimum_throughput", config.minimum_throughput},
        {"sliding_window_size", config.sliding_window_size},
        {"exponential_backoff", config.exponential_backoff},
        {"jitter", config.jitter},
        {"health_check_interval", config.health_check_interval.count()},
        {"recovery_factor", config.recovery_factor},
        {"recovery_increase_factor", config.recovery_increase_factor},
        {"recovery_decrease_factor", config.recovery_decrease_factor},
    };
}

void to_json(json& j, const BreakerSnapshot& snapshot) {
    const auto& m = snapshot.metrics;
    j = json{
        {"name", snapshot.name},
        {"state", circuit_state_str(snapshot.state)},
        {"state_duration", snapshot.state_duration},
        {"next_attempt_in", snapshot.next_attempt_in},
        {"metrics", {
            {"total_requests", m.total_requests},
            {"successful_requests", m.successful_requests},
            {"failed_requests", m.failed_requests},
            {"success_rate", m.success_rate},
            {"failure_rate", m.failure_rate},
            {"avg_response_time", m.avg_response_time},
            {"p95_response_time", m.p95_response_time},
            {"consecutive_failures", m.consecutive_failures},
            {"consecutive_successes", m.consecutive_successes},
            {"last_success_time", optional_time(m.last_success_time)},
            {"last_failure_time", optional_time(m.last_failure_time)},
            {"recent_failure_rate", m.recent_failure_rate},
        }},
        {"config", snapshot.config},
        {"recovery", {
            {"recovery_mode", snapshot.recovery.recovery_mode},
            {"gradual_recovery_rate", snapshot.recovery.gradual_recovery_rate},
            {"backoff_multiplier", snapshot.recovery.backoff_multiplier},
        }},
    };
}

void to_json(json& j, const StateChangeEvent& event) {
    j = json{
        {"timestamp", to_epoch_seconds(event.timestamp)},
        {"breaker", event.breaker_name},
        {"from_state", circuit_state_str(event.from)},
        {"to_state", circuit_state_str(event.to)},
        {"reason", event.reason},
        {"metrics_snapshot", {
            {"total_requests", event.metrics.total_requests},
            {"success_rate", event.metrics.success_rate},
            {"failure_rate", event.metrics.failure_rate},
            {"avg_response_time", event.metrics.avg_response_time},
            {"consecutive_failures", event.metrics.consecutive_failures},
        }},
    };
}

void to_json(json& j, const FailureAnalysis& analysis) {
    json types = json::object();
    for (const auto& [type, count] : analysis.failure_types) {
        types[failure_type_str(type)] = count;
    }

    json recent = json::array();
    for (const auto& f : analysis.recent_failures) {
        recent.push_back({
            {"timestamp", to_epoch_seconds(f.timestamp)},
            {"type", failure_type_str(f.failure_type)},
            {"message", f.message},
            {"age_seconds", f.age_seconds},
            {"response_time", optional_value(f.response_time)},
            {"http_status", optional_value(f.http_status)},
        });
    }

    j = json{
        {"failure_types", std::move(types)},
        {"total_failures", analysis.total_failures},
        {"recent_failures", std::move(recent)},
        {"most_common_failure", analysis.most_common_failure
                                    ? json(failure_type_str(*analysis.most_common_failure))
                                    : json(nullptr)},
    };
}

void to_json(json& j, const PerformanceAnalysis& analysis) {
    if (!analysis.has_data) {
        j = json{{"message", "No performance data available"}};
        return;
    }

    const auto& rt = analysis.response_time_stats;
    j = json{
        {"response_time_stats", {
            {"min", rt.min},
            {"max", rt.max},
            {"avg", rt.avg},
            {"median", rt.median},
            {"p95", rt.p95},
            {"p99", rt.p99},
        }},
        {"slow_calls", {
            {"threshold", analysis.slow_calls.threshold},
            {"count", analysis.slow_calls.count},
            {"rate", analysis.slow_calls.rate},
        }},
        {"trend", analysis.trend},
    };
}

void to_json(json& j, const BreakerCounts& counts) {
    j = json{
        {"total_breakers", counts.total_breakers},
        {"open_breakers", counts.open_breakers},
        {"half_open_breakers", counts.half_open_breakers},
        {"closed_breakers", counts.closed_breakers},
    };
}

void to_json(json& j, const GlobalStatus& status) {
    json breakers = json::object();
    for (const auto& [name, snapshot] : status.breakers) {
        breakers[name] = json(snapshot);
    }

    j = json{
        {"global_stats", status.global_stats},
        {"breakers", std::move(breakers)},
        {"health_summary", {
            {"healthy_percentage", status.health_summary.healthy_percentage},
            {"degraded_count", status.health_summary.degraded_count},
            {"failed_count", status.health_summary.failed_count},
        }},
    };
}

json breaker_report(const CircuitBreaker& breaker) {
    json events = json::array();
    for (const auto& e : breaker.get_recent_events()) {
        events.push_back(json(e));
    }

    return json{
        {"state", breaker.get_state()},
        {"failure_analysis", breaker.get_failure_analysis()},
        {"performance_analysis", breaker.get_performance_analysis()},
        {"state_history", std::move(events)},
    };
}

std::string global_status_json(const CircuitBreakerManager& manager, int indent) {
    const json j = manager.get_global_status();
    return j.dump(indent);
}

} // namespace siemguard
