#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "resilience/circuit_breaker.hpp"
#include "mocks/manual_clock.hpp"

using namespace siemguard;
using Catch::Approx;

namespace {

CircuitBreakerConfig recovery_config() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 5;
    cfg.success_threshold = 3;
    cfg.timeout_seconds = Seconds{10.0};
    cfg.minimum_throughput = 10;
    cfg.jitter = false;
    cfg.recovery_factor = 0.1;
    return cfg;
}

// Busy breaker (> 1000 lifetime requests) moved to HALF_OPEN
void enter_half_open(CircuitBreaker& cb, testing::ManualClock& clock) {
    for (uint64_t i = 0; i <= CircuitBreaker::kGradualRecoveryMinRequests; ++i) {
        cb.record_success(Seconds{0.05});
    }
    cb.force_open("maintenance");
    clock.advance(Seconds{10.0});
    cb.allow_request();
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: busy breakers recover gradually", "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", recovery_config(), clock.source());
    enter_half_open(cb, clock);

    REQUIRE(cb.state() == CircuitState::HALF_OPEN);
    const auto snap = cb.get_state();
    CHECK(snap.recovery.recovery_mode);
    CHECK(snap.recovery.gradual_recovery_rate == Approx(0.1));
}

TEST_CASE("CircuitBreaker: quiet breakers recover in a single step",
          "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", recovery_config(), clock.source());

    cb.force_open();
    clock.advance(Seconds{10.0});
    REQUIRE(cb.allow_request());

    REQUIRE(cb.state() == CircuitState::HALF_OPEN);
    const auto snap = cb.get_state();
    CHECK_FALSE(snap.recovery.recovery_mode);
    CHECK(snap.recovery.gradual_recovery_rate == Approx(1.0));

    // Every request is admitted in HALF_OPEN outside gradual recovery
    for (int i = 0; i < 50; ++i) {
        CHECK(cb.allow_request());
    }
}

TEST_CASE("CircuitBreaker: canary rate grows on success", "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", recovery_config(), clock.source());
    enter_half_open(cb, clock);

    cb.record_success(Seconds{0.05});
    CHECK(cb.get_state().recovery.gradual_recovery_rate == Approx(0.11));

    cb.record_success(Seconds{0.05});
    CHECK(cb.get_state().recovery.gradual_recovery_rate == Approx(0.121));

    // success_threshold reached: CLOSED, recovery over
    cb.record_success(Seconds{0.05});
    const auto snap = cb.get_state();
    CHECK(snap.state == CircuitState::CLOSED);
    CHECK_FALSE(snap.recovery.recovery_mode);
    CHECK(snap.recovery.gradual_recovery_rate == Approx(1.0));
    CHECK(snap.recovery.backoff_multiplier == Approx(1.0));
}

TEST_CASE("CircuitBreaker: canary rate halves on failure", "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", recovery_config(), clock.source());
    enter_half_open(cb, clock);

    // Lifetime failure rate stays tiny, so one failure does not reopen
    cb.record_failure(FailureType::TIMEOUT, "read timeout");
    CHECK(cb.state() == CircuitState::HALF_OPEN);
    CHECK(cb.get_state().recovery.gradual_recovery_rate == Approx(0.05));

    cb.record_failure(FailureType::TIMEOUT, "read timeout");
    CHECK(cb.get_state().recovery.gradual_recovery_rate == Approx(0.025));
}

TEST_CASE("CircuitBreaker: canary rate stays within [0, 1]", "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    auto cfg = recovery_config();
    cfg.success_threshold = 100;
    cfg.recovery_factor = 0.9;
    cfg.recovery_increase_factor = 2.0;
    CircuitBreaker cb("es", cfg, clock.source());
    enter_half_open(cb, clock);

    for (int i = 0; i < 5; ++i) cb.record_success(Seconds{0.05});
    CHECK(cb.get_state().recovery.gradual_recovery_rate == Approx(1.0));
}

TEST_CASE("CircuitBreaker: canary gating admits a fraction of traffic",
          "[circuit_breaker][recovery]") {
    testing::ManualClock clock;

    SECTION("Rate 0.1 admits roughly one in ten") {
        CircuitBreaker cb("es", recovery_config(), clock.source());
        enter_half_open(cb, clock);

        int admitted = 0;
        for (int i = 0; i < 2000; ++i) {
            if (cb.allow_request()) ++admitted;
        }
        CHECK(admitted > 100);
        CHECK(admitted < 400);
    }

    SECTION("Canary rejections carry no retry delay") {
        auto cfg = recovery_config();
        cfg.recovery_factor = 0.01;
        CircuitBreaker cb("es", cfg, clock.source());
        enter_half_open(cb, clock);

        bool rejected = false;
        for (int i = 0; i < 1000 && !rejected; ++i) {
            try {
                cb.call([] {});
            } catch (const CircuitOpenError& e) {
                rejected = true;
                CHECK(e.retry_after_seconds() == Approx(0.0));
            }
        }
        CHECK(rejected);
        CHECK(cb.state() == CircuitState::HALF_OPEN);
    }
}

TEST_CASE("CircuitBreaker: a shrunken canary rate still recovers", "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    auto cfg = recovery_config();
    cfg.recovery_decrease_factor = 0.01;
    CircuitBreaker cb("es", cfg, clock.source());
    enter_half_open(cb, clock);

    cb.record_failure(FailureType::TIMEOUT, "read timeout");
    REQUIRE(cb.state() == CircuitState::HALF_OPEN);
    const double rate = cb.get_state().recovery.gradual_recovery_rate;
    CHECK(rate == Approx(0.001));
    CHECK(rate > 0.0);

    // Admissions stay rare but possible; admitted successes close the breaker
    int calls = 0;
    while (cb.state() == CircuitState::HALF_OPEN && calls < 200000) {
        ++calls;
        try {
            cb.call([] {});
        } catch (const CircuitOpenError&) {
        }
    }
    CHECK(cb.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: zero decrease factor is rejected", "[circuit_breaker][recovery][config]") {
    auto cfg = recovery_config();
    cfg.recovery_decrease_factor = 0.0;
    const auto errors = validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("recovery_decrease_factor") != std::string::npos);
}

TEST_CASE("CircuitBreaker: failures in HALF_OPEN reopen on consecutive threshold",
          "[circuit_breaker][recovery]") {
    testing::ManualClock clock;
    CircuitBreaker cb("es", recovery_config(), clock.source());
    enter_half_open(cb, clock);

    for (int i = 0; i < 4; ++i) {
        cb.record_failure(FailureType::CONNECTION_ERROR, "connection reset");
    }
    CHECK(cb.state() == CircuitState::HALF_OPEN);

    cb.record_failure(FailureType::CONNECTION_ERROR, "connection reset");
    CHECK(cb.state() == CircuitState::OPEN);
    // force_open doubled the multiplier once already
    CHECK(cb.next_attempt_in() == Approx(20.0));
}
