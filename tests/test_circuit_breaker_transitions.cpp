#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "resilience/circuit_breaker.hpp"
#include "mocks/manual_clock.hpp"

#include <stdexcept>
#include <string>

using namespace siemguard;
using Catch::Approx;

namespace {

CircuitBreakerConfig scenario_config() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 3;
    cfg.minimum_throughput = 3;
    cfg.timeout_seconds = Seconds{10.0};
    cfg.success_threshold = 2;
    cfg.jitter = false;
    return cfg;
}

void fail_once(CircuitBreaker& cb) {
    try {
        cb.call([]() -> int { throw std::runtime_error("connection refused"); });
    } catch (const CircuitOpenError&) {
        throw;
    } catch (const std::runtime_error&) {
    }
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: starts CLOSED and admits requests", "[circuit_breaker]") {
    testing::ManualClock clock;
    CircuitBreaker cb("siem", scenario_config(), clock.source());

    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());
    CHECK(cb.next_attempt_in() == Approx(0.0));
    CHECK(cb.name() == "siem");
    CHECK_FALSE(cb.health_check_active());
}

TEST_CASE("CircuitBreaker: call returns the operation's result", "[circuit_breaker][call]") {
    testing::ManualClock clock;
    CircuitBreaker cb("siem", scenario_config(), clock.source());

    SECTION("Non-void result with arguments") {
        const int sum = cb.call([](int a, int b) { return a + b; }, 2, 3);
        CHECK(sum == 5);
    }

    SECTION("Void operation") {
        bool ran = false;
        cb.call([&] { ran = true; });
        CHECK(ran);
    }

    const auto snap = cb.get_state();
    CHECK(snap.metrics.total_requests == 1);
    CHECK(snap.metrics.successful_requests == 1);
    CHECK(snap.metrics.last_success_time == clock.now());
}

TEST_CASE("CircuitBreaker: operation errors are rethrown unchanged", "[circuit_breaker][call]") {
    testing::ManualClock clock;
    CircuitBreaker cb("siem", scenario_config(), clock.source());

    try {
        cb.call([]() { throw HttpStatusError(429, "Too Many Requests"); });
        FAIL("expected HttpStatusError");
    } catch (const HttpStatusError& e) {
        CHECK(e.status_code() == 429);
        CHECK(std::string(e.what()) == "Too Many Requests");
    }

    const auto snap = cb.get_state();
    CHECK(snap.metrics.failed_requests == 1);
    CHECK(snap.metrics.consecutive_failures == 1);

    const auto analysis = cb.get_failure_analysis();
    CHECK(analysis.failure_types.at(FailureType::RATE_LIMIT) == 1);
    REQUIRE(analysis.recent_failures.size() == 1);
    REQUIRE(analysis.recent_failures[0].http_status.has_value());
    CHECK(*analysis.recent_failures[0].http_status == 429);
    CHECK(analysis.recent_failures[0].response_time.has_value());
}

TEST_CASE("CircuitBreaker: consecutive failures trip, cooldown, recovery",
          "[circuit_breaker][transitions]") {
    testing::ManualClock clock;
    CircuitBreaker cb("wazuh", scenario_config(), clock.source());

    fail_once(cb);
    fail_once(cb);
    CHECK(cb.state() == CircuitState::CLOSED);
    fail_once(cb);
    CHECK(cb.state() == CircuitState::OPEN);
    CHECK(cb.next_attempt_in() == Approx(10.0));

    // Rejected before the cooldown without invoking the operation
    clock.advance(Seconds{4.0});
    bool invoked = false;
    try {
        cb.call([&] { invoked = true; });
        FAIL("expected CircuitOpenError");
    } catch (const CircuitOpenError& e) {
        CHECK(e.breaker_name() == "wazuh");
        CHECK(e.retry_after_seconds() == Approx(6.0));
        CHECK(std::string(e.what()) ==
              "Circuit breaker is OPEN for wazuh. Next attempt in 6.0 seconds");
    }
    CHECK_FALSE(invoked);
    CHECK(cb.get_state().metrics.total_requests == 3);

    // After the cooldown one call is admitted as a trial
    clock.advance(Seconds{6.0});
    CHECK(cb.call([] { return 1; }) == 1);
    CHECK(cb.state() == CircuitState::HALF_OPEN);

    CHECK(cb.call([] { return 2; }) == 2);
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.get_state().recovery.backoff_multiplier == Approx(1.0));
}

TEST_CASE("CircuitBreaker: second OPEN doubles the cooldown", "[circuit_breaker][backoff]") {
    testing::ManualClock clock;

    SECTION("Without jitter") {
        CircuitBreaker cb("splunk", scenario_config(), clock.source());
        for (int i = 0; i < 3; ++i) fail_once(cb);
        CHECK(cb.get_state().recovery.backoff_multiplier == Approx(2.0));

        clock.advance(Seconds{10.0});
        REQUIRE(cb.allow_request());
        REQUIRE(cb.state() == CircuitState::HALF_OPEN);

        // One failure in HALF_OPEN: lifetime failure rate is 100%
        fail_once(cb);
        CHECK(cb.state() == CircuitState::OPEN);
        CHECK(cb.next_attempt_in() == Approx(20.0));
        CHECK(cb.get_state().recovery.backoff_multiplier == Approx(4.0));
    }

    SECTION("With jitter the cooldown stays within 20 percent") {
        auto cfg = scenario_config();
        cfg.jitter = true;
        CircuitBreaker cb("splunk", cfg, clock.source());
        for (int i = 0; i < 3; ++i) fail_once(cb);

        const double first = cb.next_attempt_in();
        CHECK(first >= 8.0);
        CHECK(first <= 12.0);

        clock.advance(Seconds{12.0});
        REQUIRE(cb.allow_request());
        fail_once(cb);

        const double second = cb.next_attempt_in();
        CHECK(second >= 16.0);
        CHECK(second <= 24.0);
    }
}

TEST_CASE("CircuitBreaker: backoff is capped at max_timeout", "[circuit_breaker][backoff]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.max_timeout_seconds = Seconds{25.0};
    CircuitBreaker cb("es", cfg, clock.source());

    for (int i = 0; i < 3; ++i) fail_once(cb);
    for (int episode = 0; episode < 3; ++episode) {
        clock.advance(Seconds{cb.next_attempt_in()});
        REQUIRE(cb.allow_request());
        fail_once(cb);
        REQUIRE(cb.state() == CircuitState::OPEN);
    }
    // 10 * 8 capped to 25
    CHECK(cb.next_attempt_in() == Approx(25.0));
}

TEST_CASE("CircuitBreaker: fixed cooldown without exponential backoff",
          "[circuit_breaker][backoff]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.exponential_backoff = false;
    CircuitBreaker cb("es", cfg, clock.source());

    for (int i = 0; i < 3; ++i) fail_once(cb);
    clock.advance(Seconds{10.0});
    REQUIRE(cb.allow_request());
    fail_once(cb);

    CHECK(cb.next_attempt_in() == Approx(10.0));
    CHECK(cb.get_state().recovery.backoff_multiplier == Approx(1.0));
}

TEST_CASE("CircuitBreaker: next_attempt_in counts down while OPEN",
          "[circuit_breaker][transitions]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", scenario_config(), clock.source());
    for (int i = 0; i < 3; ++i) fail_once(cb);

    double previous = cb.next_attempt_in();
    for (int i = 0; i < 12; ++i) {
        clock.advance(Seconds{1.0});
        const double current = cb.next_attempt_in();
        CHECK(current <= previous);
        CHECK(current >= 0.0);
        previous = current;
    }
    CHECK(previous == Approx(0.0));
    // Still OPEN until the next admission check
    CHECK(cb.state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: no evaluation below minimum throughput",
          "[circuit_breaker][transitions]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.failure_threshold = 2;
    cfg.minimum_throughput = 5;
    CircuitBreaker cb("es", cfg, clock.source());

    for (int i = 0; i < 4; ++i) fail_once(cb);
    CHECK(cb.state() == CircuitState::CLOSED);

    fail_once(cb);
    CHECK(cb.state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: lifetime failure rate trips", "[circuit_breaker][transitions]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.failure_threshold = 100;
    cfg.minimum_throughput = 4;
    cfg.failure_rate_threshold = 50.0;
    CircuitBreaker cb("es", cfg, clock.source());

    cb.record_success(Seconds{0.1});
    cb.record_failure(FailureType::TIMEOUT, "read timeout");
    cb.record_success(Seconds{0.1});
    CHECK(cb.state() == CircuitState::CLOSED);

    cb.record_failure(FailureType::TIMEOUT, "read timeout");
    CHECK(cb.state() == CircuitState::OPEN);

    const auto events = cb.get_recent_events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].reason == "high failure rate (50.0%)");
}

TEST_CASE("CircuitBreaker: slow call rate trips on the next failure",
          "[circuit_breaker][transitions]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.failure_threshold = 100;
    cfg.failure_rate_threshold = 100.0;
    cfg.slow_call_threshold = Seconds{1.0};
    cfg.slow_call_rate_threshold = 50.0;
    cfg.minimum_throughput = 3;
    CircuitBreaker cb("es", cfg, clock.source());

    bool reported_slow = false;
    cb.set_on_success([&](Seconds, bool slow) { reported_slow = slow; });

    for (int i = 0; i < 3; ++i) cb.record_success(Seconds{2.0});
    CHECK(reported_slow);
    // Successes alone never open the breaker
    CHECK(cb.state() == CircuitState::CLOSED);

    cb.record_failure(FailureType::UNKNOWN, "boom");
    CHECK(cb.state() == CircuitState::OPEN);

    const auto events = cb.get_recent_events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].reason == "high slow call rate (100.0%)");
}

TEST_CASE("CircuitBreaker: reset returns to CLOSED and keeps metrics",
          "[circuit_breaker][admin]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", scenario_config(), clock.source());
    for (int i = 0; i < 3; ++i) fail_once(cb);
    REQUIRE(cb.state() == CircuitState::OPEN);

    cb.reset();

    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());
    CHECK(cb.next_attempt_in() == Approx(0.0));

    const auto snap = cb.get_state();
    CHECK(snap.metrics.total_requests == 3);
    CHECK(snap.metrics.failed_requests == 3);
    CHECK(snap.metrics.consecutive_failures == 0);
    CHECK(snap.recovery.backoff_multiplier == Approx(1.0));
    CHECK_FALSE(snap.recovery.recovery_mode);
    CHECK(snap.recovery.gradual_recovery_rate == Approx(1.0));

    const auto events = cb.get_recent_events();
    REQUIRE(events.size() == 2);
    CHECK(events[1].from == CircuitState::OPEN);
    CHECK(events[1].to == CircuitState::CLOSED);
    CHECK(events[1].reason == "Manual reset");

    // Backoff starts over: the next OPEN waits the base timeout
    for (int i = 0; i < 3; ++i) fail_once(cb);
    CHECK(cb.next_attempt_in() == Approx(10.0));
}

TEST_CASE("CircuitBreaker: force_open", "[circuit_breaker][admin]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", scenario_config(), clock.source());

    cb.force_open("maintenance window");
    CHECK(cb.state() == CircuitState::OPEN);
    CHECK_FALSE(cb.allow_request());
    CHECK(cb.next_attempt_in() == Approx(10.0));

    // Already OPEN: no second event, cooldown unchanged
    clock.advance(Seconds{3.0});
    cb.force_open();
    CHECK(cb.next_attempt_in() == Approx(7.0));

    const auto events = cb.get_recent_events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].reason == "maintenance window");
}

TEST_CASE("CircuitBreaker: state snapshot", "[circuit_breaker][snapshot]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", scenario_config(), clock.source());

    cb.record_success(Seconds{1.0});
    cb.record_success(Seconds{2.0});
    cb.record_failure(FailureType::TIMEOUT, "timeout");
    clock.advance(Seconds{5.0});

    const auto snap = cb.get_state();
    CHECK(snap.name == "es");
    CHECK(snap.state == CircuitState::CLOSED);
    CHECK(snap.state_duration == Approx(5.0));
    CHECK(snap.next_attempt_in == Approx(0.0));
    CHECK(snap.metrics.total_requests == 3);
    CHECK(snap.metrics.success_rate == Approx(200.0 / 3.0));
    CHECK(snap.metrics.failure_rate == Approx(100.0 / 3.0));
    CHECK(snap.metrics.avg_response_time == Approx(1.1));
    CHECK(snap.metrics.recent_failure_rate == Approx(100.0 / 3.0));
    CHECK(snap.config.failure_threshold == 3);
    CHECK(snap.config.timeout_seconds.count() == Approx(10.0));
}

TEST_CASE("CircuitBreaker: recent events are bounded", "[circuit_breaker][events]") {
    testing::ManualClock clock;
    auto cfg = scenario_config();
    cfg.exponential_backoff = false;
    CircuitBreaker cb("es", cfg, clock.source());

    for (int i = 0; i < 60; ++i) {
        cb.force_open();
        cb.reset();
    }

    const auto events = cb.get_recent_events();
    CHECK(events.size() == CircuitBreaker::kMaxRecentEvents);
    CHECK(events.back().reason == "Manual reset");
}
