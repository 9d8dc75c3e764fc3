#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/core/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>

namespace agentrelay::memory {

using namespace agentrelay::core;

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string_view circuit_state_to_string(CircuitState state);

struct BreakerStats {
    CircuitState state = CircuitState::Closed;
    int consecutive_failures = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    uint64_t times_opened = 0;
    uint64_t rejected = 0;
    std::optional<Duration> open_for;  // time since the breaker last opened, unless Closed

    Json to_json() const;
};

// Gates calls to the external memory store.
//   Closed   -> Open      after failure_threshold consecutive failures
//   Open     -> HalfOpen  once cooldown has elapsed (checked in allow())
//   HalfOpen -> Closed    on trial success
//   HalfOpen -> Open      on trial failure, cooldown restarts
class CircuitBreaker {
public:
    using ClockFn = std::function<SteadyClock::time_point()>;

    explicit CircuitBreaker(const BreakerConfig& config, ClockFn clock = nullptr);

    // true when a call may go ahead; in HalfOpen only half_open_trials calls are let through
    bool allow();
    void record_success();
    void record_failure();

    CircuitState state() const;

    // Open with the cooldown still running; unlike allow() this never moves to HalfOpen
    bool rejecting() const;
    BreakerStats stats() const;

    // Operator controls
    void force_open();
    void force_close();
    void reset();

private:
    BreakerConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    int consecutive_failures_ = 0;
    int trials_issued_ = 0;
    SteadyClock::time_point open_since_{};
    uint64_t total_successes_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t times_opened_ = 0;
    uint64_t rejected_ = 0;

    void open_locked(SteadyClock::time_point now);
};

}  // namespace agentrelay::memory
