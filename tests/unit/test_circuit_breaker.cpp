#include <catch2/catch_test_macros.hpp>
#include "agentrelay/memory/circuit_breaker.hpp"

#include <chrono>

using namespace agentrelay::memory;
using namespace std::chrono_literals;

namespace {

// Manually advanced clock
struct ManualClock {
    SteadyClock::time_point now = SteadyClock::time_point{} + 1h;

    CircuitBreaker::ClockFn fn() {
        return [this] { return now; };
    }
};

BreakerConfig config(int threshold = 5, int cooldown_ms = 1000, int trials = 1) {
    BreakerConfig c;
    c.failure_threshold = threshold;
    c.cooldown_ms = cooldown_ms;
    c.half_open_trials = trials;
    return c;
}

}  // namespace

TEST_CASE("Opens after N consecutive failures", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(5), clock.fn());

    for (int i = 0; i < 4; ++i) {
        REQUIRE(breaker.allow());
        breaker.record_failure();
    }
    REQUIRE(breaker.state() == CircuitState::Closed);

    breaker.record_failure();
    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE_FALSE(breaker.allow());
    REQUIRE(breaker.stats().times_opened == 1);
}

TEST_CASE("Success resets the consecutive count", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(3), clock.fn());

    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    breaker.record_failure();
    breaker.record_failure();

    REQUIRE(breaker.state() == CircuitState::Closed);
    REQUIRE(breaker.stats().consecutive_failures == 2);
}

TEST_CASE("Exactly one half-open trial after cooldown", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(5, 1000), clock.fn());

    for (int i = 0; i < 5; ++i) {
        breaker.record_failure();
    }
    REQUIRE(breaker.state() == CircuitState::Open);

    clock.now += 999ms;
    REQUIRE_FALSE(breaker.allow());

    clock.now += 1ms;
    REQUIRE(breaker.allow());
    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE_FALSE(breaker.allow());
    REQUIRE_FALSE(breaker.allow());
}

TEST_CASE("Trial success closes the breaker", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(1, 100), clock.fn());

    breaker.record_failure();
    clock.now += 100ms;
    REQUIRE(breaker.allow());

    breaker.record_success();
    REQUIRE(breaker.state() == CircuitState::Closed);
    REQUIRE(breaker.allow());
    REQUIRE(breaker.allow());
}

TEST_CASE("Trial failure reopens and restarts the cooldown", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(1, 100), clock.fn());

    breaker.record_failure();
    clock.now += 150ms;
    REQUIRE(breaker.allow());

    breaker.record_failure();
    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE(breaker.stats().times_opened == 2);

    clock.now += 50ms;
    REQUIRE_FALSE(breaker.allow());
    clock.now += 50ms;
    REQUIRE(breaker.allow());
}

TEST_CASE("Operator controls", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(), clock.fn());

    breaker.force_open();
    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE_FALSE(breaker.allow());

    breaker.force_close();
    REQUIRE(breaker.allow());

    breaker.record_failure();
    breaker.reset();
    auto stats = breaker.stats();
    REQUIRE(stats.total_failures == 0);
    REQUIRE(stats.state == CircuitState::Closed);
    REQUIRE(stats.to_json()["state"] == "closed");
}

TEST_CASE("Open duration follows the breaker's clock", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(1, 1000), clock.fn());

    REQUIRE_FALSE(breaker.stats().open_for.has_value());
    REQUIRE_FALSE(breaker.stats().to_json().contains("open_for_ms"));

    breaker.record_failure();
    clock.now += 250ms;

    auto stats = breaker.stats();
    REQUIRE(stats.open_for.has_value());
    REQUIRE(stats.open_for->count() == 250);
    REQUIRE(stats.to_json()["open_for_ms"] == 250);
}

TEST_CASE("Rejecting only while the cooldown runs", "[breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(config(1, 100), clock.fn());

    REQUIRE_FALSE(breaker.rejecting());
    breaker.record_failure();
    REQUIRE(breaker.rejecting());

    clock.now += 100ms;
    REQUIRE_FALSE(breaker.rejecting());
    // Checking does not spend the half-open trial
    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE(breaker.allow());
    REQUIRE(breaker.state() == CircuitState::HalfOpen);
}
