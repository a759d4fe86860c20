#include "resilience/circuit_breaker.hpp"

#include <algorithm>
#include <format>

namespace siemguard {

namespace {

/**
 * @brief Invoke a user handler; its exceptions are logged, never propagated
 */
template<typename Handler, typename... Args>
void safe_invoke(const std::string& breaker_name, const char* which,
                 const Handler& handler, Args&&... args) {
    if (!handler) return;
    try {
        handler(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Circuit breaker {}: {} handler error: {}",
                                      breaker_name, which, e.what()));
    } catch (...) {
        utils::log::error(std::format("Circuit breaker {}: {} handler error: unknown exception",
                                      breaker_name, which));
    }
}

Timestamp::duration to_clock_duration(double seconds) {
    return std::chrono::duration_cast<Timestamp::duration>(Seconds{seconds});
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(std::string name,
                               CircuitBreakerConfig config,
                               TimeSource clock,
                               std::shared_ptr<const FailureClassifier> classifier)
    : name_(std::move(name)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : TimeSource(&utils::now)),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<const FailureClassifier>()),
      metrics_(config_.sliding_window_size),
      state_changed_time_(clock_()) {
    utils::log::info(std::format("Circuit breaker initialized: {}", name_));
}

CircuitBreaker::~CircuitBreaker() {
    cleanup();
}

// ============================================================================
// Admission
// ============================================================================

bool CircuitBreaker::allow_request() {
    bool admitted = false;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();

        switch (state_) {
            case CircuitState::CLOSED:
                admitted = true;
                break;

            case CircuitState::OPEN:
                if (current >= next_attempt_time_) {
                    transition_to_half_open(current);
                    admitted = true;
                }
                break;

            case CircuitState::HALF_OPEN:
                // Canary gating: only a fraction of traffic during gradual recovery
                admitted = !recovery_mode_ ||
                           utils::uniform_real(0.0, 1.0) < gradual_recovery_rate_;
                break;
        }
    }
    dispatch_pending_events();
    return admitted;
}

// ============================================================================
// Outcome Recording
// ============================================================================

void CircuitBreaker::record_success(Seconds response_time) {
    const bool slow_call = response_time > config_.slow_call_threshold;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        metrics_.record_success(response_time, current);

        if (state_ == CircuitState::HALF_OPEN) {
            if (metrics_.consecutive_successes() >= config_.success_threshold) {
                transition_to_closed(current);
            } else if (recovery_mode_) {
                gradual_recovery_rate_ = std::min(
                    1.0, gradual_recovery_rate_ * config_.recovery_increase_factor);
            }
        }
    }

    if (slow_call) {
        utils::log::warn(std::format("Slow call detected for {}: {:.2f}s",
                                     name_, response_time.count()));
    }

    dispatch_pending_events();
    {
        std::lock_guard dispatch_lock(dispatch_mutex_);
        const auto handler = on_success_;
        safe_invoke(name_, "on_success", handler, response_time, slow_call);
    }

    utils::log::debug(std::format("Success recorded for {} ({:.3f}s)",
                                  name_, response_time.count()));
}

void CircuitBreaker::record_failure(const std::exception_ptr& error,
                                    std::optional<Seconds> response_time) {
    const auto ctx = FailureClassifier::describe(error);

    FailureRecord record;
    record.failure_type = classifier_->classify(ctx);
    record.message = ctx.message;
    record.response_time = response_time;
    record.http_status = ctx.http_status;
    record_failure_record(std::move(record));
}

void CircuitBreaker::record_failure(FailureType type,
                                    std::string message,
                                    std::optional<Seconds> response_time,
                                    std::optional<int> http_status) {
    FailureRecord record;
    record.failure_type = type;
    record.message = std::move(message);
    record.response_time = response_time;
    record.http_status = http_status;
    record_failure_record(std::move(record));
}

void CircuitBreaker::record_failure_record(FailureRecord record) {
    bool opened = false;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        record.timestamp = current;
        metrics_.record_failure(record);

        // A failed canary halves admission before any reopen decision
        if (state_ == CircuitState::HALF_OPEN && recovery_mode_) {
            gradual_recovery_rate_ = std::clamp(
                gradual_recovery_rate_ * config_.recovery_decrease_factor, 0.0, 1.0);
        }

        opened = evaluate_circuit_state(current);
    }

    after_update(opened);
    {
        std::lock_guard dispatch_lock(dispatch_mutex_);
        const auto handler = on_failure_;
        safe_invoke(name_, "on_failure", handler, record);
    }

    utils::log::warn(std::format("Failure recorded for {}: {} - {}",
                                 name_, failure_type_str(record.failure_type), record.message));
}

// ============================================================================
// State Machine (mutex_ held)
// ============================================================================

bool CircuitBreaker::evaluate_circuit_state(Timestamp now) {
    if (state_ == CircuitState::OPEN) return false;
    if (metrics_.total_requests() < config_.minimum_throughput) return false;

    std::optional<std::string> reason;

    if (metrics_.consecutive_failures() >= config_.failure_threshold) {
        reason = std::format("consecutive failures ({})", metrics_.consecutive_failures());
    } else if (metrics_.failure_rate() >= config_.failure_rate_threshold) {
        reason = std::format("high failure rate ({:.1f}%)", metrics_.failure_rate());
    }

    const double slow_call_rate = metrics_.slow_call_rate(config_.slow_call_threshold);
    if (slow_call_rate >= config_.slow_call_rate_threshold) {
        reason = std::format("high slow call rate ({:.1f}%)", slow_call_rate);
    }

    if (!reason) return false;
    return transition_to_open(*reason, now);
}

bool CircuitBreaker::transition_to_open(const std::string& reason, Timestamp now) {
    if (state_ == CircuitState::OPEN) return false;

    utils::log::warn(std::format("Circuit breaker OPEN for {}: {}", name_, reason));

    const CircuitState old_state = state_;
    state_ = CircuitState::OPEN;
    state_changed_time_ = now;

    double backoff = std::min(config_.timeout_seconds.count() * backoff_multiplier_,
                              config_.max_timeout_seconds.count());
    if (config_.jitter) {
        // Avoid synchronized retries across breakers
        backoff *= utils::uniform_real(0.8, 1.2);
    }
    if (config_.exponential_backoff) {
        backoff_multiplier_ *= 2.0;
    }
    next_attempt_time_ = now + to_clock_duration(backoff);
    ++open_episode_;

    record_state_change(old_state, CircuitState::OPEN, reason, now);
    return true;
}

void CircuitBreaker::transition_to_half_open(Timestamp now) {
    if (state_ == CircuitState::HALF_OPEN) return;

    utils::log::info(std::format("Circuit breaker HALF_OPEN for {}", name_));

    const CircuitState old_state = state_;
    state_ = CircuitState::HALF_OPEN;
    state_changed_time_ = now;
    metrics_.reset_consecutive();

    if (metrics_.total_requests() > kGradualRecoveryMinRequests) {
        recovery_mode_ = true;
        gradual_recovery_rate_ = config_.recovery_factor;
    } else {
        recovery_mode_ = false;
        gradual_recovery_rate_ = 1.0;
    }

    record_state_change(old_state, CircuitState::HALF_OPEN, "Testing recovery", now);
}

void CircuitBreaker::transition_to_closed(Timestamp now) {
    if (state_ == CircuitState::CLOSED) return;

    utils::log::info(std::format("Circuit breaker CLOSED for {}", name_));

    const CircuitState old_state = state_;
    state_ = CircuitState::CLOSED;
    state_changed_time_ = now;
    backoff_multiplier_ = 1.0;
    recovery_mode_ = false;
    gradual_recovery_rate_ = 1.0;

    record_state_change(old_state, CircuitState::CLOSED, "Recovery completed", now);
}

void CircuitBreaker::record_state_change(CircuitState from, CircuitState to,
                                         std::string reason, Timestamp now) {
    StateChangeEvent event;
    event.from = from;
    event.to = to;
    event.timestamp = now;
    event.breaker_name = name_;
    event.reason = std::move(reason);
    event.metrics.total_requests = metrics_.total_requests();
    event.metrics.success_rate = metrics_.success_rate();
    event.metrics.failure_rate = metrics_.failure_rate();
    event.metrics.avg_response_time = metrics_.avg_response_time();
    event.metrics.consecutive_failures = metrics_.consecutive_failures();

    recent_events_.push_back(event);
    while (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    pending_events_.push_back(std::move(event));

    // Wakes the health check so it can exit when the state leaves OPEN
    state_cv_.notify_all();
}

double CircuitBreaker::time_until_next_attempt(Timestamp now) const {
    if (state_ != CircuitState::OPEN) return 0.0;
    return std::max(0.0, std::chrono::duration_cast<Seconds>(next_attempt_time_ - now).count());
}

// ============================================================================
// Event Delivery (mutex_ not held)
// ============================================================================

void CircuitBreaker::after_update(bool opened) {
    if (opened) {
        start_health_check();
    }
    dispatch_pending_events();
}

void CircuitBreaker::dispatch_pending_events() {
    std::lock_guard dispatch_lock(dispatch_mutex_);
    while (true) {
        StateChangeEvent event;
        {
            std::lock_guard lock(mutex_);
            if (pending_events_.empty()) return;
            event = std::move(pending_events_.front());
            pending_events_.pop_front();
        }
        // Copied so a handler can replace itself while it runs
        const auto handler = on_state_change_;
        safe_invoke(name_, "on_state_change", handler, event);
    }
}

void CircuitBreaker::set_on_success(SuccessHandler handler) {
    std::lock_guard dispatch_lock(dispatch_mutex_);
    on_success_ = std::move(handler);
}

void CircuitBreaker::set_on_failure(FailureHandler handler) {
    std::lock_guard dispatch_lock(dispatch_mutex_);
    on_failure_ = std::move(handler);
}

void CircuitBreaker::set_on_state_change(StateChangeHandler handler) {
    std::lock_guard dispatch_lock(dispatch_mutex_);
    on_state_change_ = std::move(handler);
}

// ============================================================================
// Background Health Check
// ============================================================================

void CircuitBreaker::start_health_check() {
    std::lock_guard health_lock(health_mutex_);
    if (health_thread_.joinable()) {
        health_thread_.request_stop();
        health_thread_.join();
    }

    uint64_t episode = 0;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::OPEN) return;
        episode = open_episode_;
    }

    health_check_active_.store(true, std::memory_order_release);
    health_thread_ = std::jthread([this, episode](std::stop_token stop) {
        health_check_loop(std::move(stop), episode);
    });
}

void CircuitBreaker::stop_health_check() {
    std::lock_guard health_lock(health_mutex_);
    if (health_thread_.joinable()) {
        health_thread_.request_stop();
        health_thread_.join();
    }
    health_check_active_.store(false, std::memory_order_release);
}

void CircuitBreaker::health_check_loop(std::stop_token stop, uint64_t episode) {
    const auto interval = std::max(
        std::chrono::milliseconds{1},
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.health_check_interval));

    std::unique_lock lock(mutex_);
    while (true) {
        const bool left_open = state_cv_.wait_for(lock, stop, interval, [&] {
            return state_ != CircuitState::OPEN || open_episode_ != episode;
        });

        if (stop.stop_requested()) {
            utils::log::debug(std::format("Health check cancelled for {}", name_));
            break;
        }
        if (left_open) {
            break;
        }
        if (now() >= next_attempt_time_) {
            utils::log::debug(std::format("Health check ready for {}", name_));
            break;
        }
    }
    health_check_active_.store(false, std::memory_order_release);
}

// ============================================================================
// Reporting
// ============================================================================

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

double CircuitBreaker::next_attempt_in() const {
    std::lock_guard lock(mutex_);
    return time_until_next_attempt(now());
}

BreakerSnapshot CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    const auto current = now();

    BreakerSnapshot snap;
    snap.name = name_;
    snap.state = state_;
    snap.state_duration = std::chrono::duration_cast<Seconds>(current - state_changed_time_).count();
    snap.next_attempt_in = time_until_next_attempt(current);

    auto& m = snap.metrics;
    m.total_requests = metrics_.total_requests();
    m.successful_requests = metrics_.successful_requests();
    m.failed_requests = metrics_.failed_requests();
    m.success_rate = metrics_.success_rate();
    m.failure_rate = metrics_.failure_rate();
    m.avg_response_time = metrics_.avg_response_time();
    m.p95_response_time = metrics_.p95_response_time();
    m.consecutive_failures = metrics_.consecutive_failures();
    m.consecutive_successes = metrics_.consecutive_successes();
    m.last_success_time = metrics_.last_success_time();
    m.last_failure_time = metrics_.last_failure_time();
    m.recent_failure_rate = metrics_.recent_failure_rate(current);

    snap.config = config_;

    snap.recovery.recovery_mode = recovery_mode_;
    snap.recovery.gradual_recovery_rate = gradual_recovery_rate_;
    snap.recovery.backoff_multiplier = backoff_multiplier_;
    return snap;
}

FailureAnalysis CircuitBreaker::get_failure_analysis() const {
    std::lock_guard lock(mutex_);
    return metrics_.failure_analysis(now());
}

PerformanceAnalysis CircuitBreaker::get_performance_analysis() const {
    std::lock_guard lock(mutex_);
    return metrics_.performance_analysis(config_.slow_call_threshold);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

// ============================================================================
// Administration
// ============================================================================

void CircuitBreaker::reset() {
    utils::log::info(std::format("Resetting circuit breaker: {}", name_));

    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        const CircuitState old_state = state_;

        state_ = CircuitState::CLOSED;
        state_changed_time_ = current;
        next_attempt_time_ = Timestamp{};
        backoff_multiplier_ = 1.0;
        recovery_mode_ = false;
        gradual_recovery_rate_ = 1.0;
        metrics_.reset_consecutive();
        // Cumulative metrics and histories are kept for postmortems

        record_state_change(old_state, CircuitState::CLOSED, "Manual reset", current);
    }

    stop_health_check();
    dispatch_pending_events();
}

void CircuitBreaker::force_open(const std::string& reason) {
    utils::log::warn(std::format("Force opening circuit breaker: {} - {}", name_, reason));

    bool opened = false;
    {
        std::lock_guard lock(mutex_);
        opened = transition_to_open(reason, now());
    }
    after_update(opened);
}

void CircuitBreaker::cleanup() {
    stop_health_check();
}

} // namespace siemguard
