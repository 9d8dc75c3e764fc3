#include "agentrelay/memory/circuit_breaker.hpp"

#include <spdlog/spdlog.h>

namespace agentrelay::memory {

std::string_view circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

Json BreakerStats::to_json() const {
    Json j{
        {"state", std::string(circuit_state_to_string(state))},
        {"consecutive_failures", consecutive_failures},
        {"total_successes", total_successes},
        {"total_failures", total_failures},
        {"times_opened", times_opened},
        {"rejected", rejected}
    };
    if (open_for) {
        j["open_for_ms"] = open_for->count();
    }
    return j;
}

CircuitBreaker::CircuitBreaker(const BreakerConfig& config, ClockFn clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); }))
{
}

void CircuitBreaker::open_locked(SteadyClock::time_point now) {
    state_ = CircuitState::Open;
    open_since_ = now;
    trials_issued_ = 0;
    ++times_opened_;
}

bool CircuitBreaker::allow() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == CircuitState::Closed) {
        return true;
    }

    if (state_ == CircuitState::Open) {
        auto now = clock_();
        if (now - open_since_ < Duration{config_.cooldown_ms}) {
            ++rejected_;
            return false;
        }
        state_ = CircuitState::HalfOpen;
        trials_issued_ = 0;
        spdlog::info("Circuit breaker half-open after {}ms cooldown", config_.cooldown_ms);
    }

    // HalfOpen
    if (trials_issued_ < config_.half_open_trials) {
        ++trials_issued_;
        return true;
    }
    ++rejected_;
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_successes_;
    consecutive_failures_ = 0;
    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Closed;
        trials_issued_ = 0;
        spdlog::info("Circuit breaker closed after successful trial");
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_failures_;
    ++consecutive_failures_;

    if (state_ == CircuitState::HalfOpen) {
        open_locked(clock_());
        spdlog::warn("Circuit breaker re-opened: trial call failed");
        return;
    }

    if (state_ == CircuitState::Closed && consecutive_failures_ >= config_.failure_threshold) {
        open_locked(clock_());
        spdlog::warn("Circuit breaker opened after {} consecutive failures", consecutive_failures_);
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::rejecting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Open && clock_() - open_since_ < Duration{config_.cooldown_ms};
}

BreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BreakerStats stats;
    stats.state = state_;
    stats.consecutive_failures = consecutive_failures_;
    stats.total_successes = total_successes_;
    stats.total_failures = total_failures_;
    stats.times_opened = times_opened_;
    stats.rejected = rejected_;
    if (state_ != CircuitState::Closed) {
        stats.open_for = std::chrono::duration_cast<Duration>(clock_() - open_since_);
    }
    return stats;
}

void CircuitBreaker::force_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked(clock_());
    spdlog::warn("Circuit breaker forced open");
}

void CircuitBreaker::force_close() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    consecutive_failures_ = 0;
    trials_issued_ = 0;
    spdlog::info("Circuit breaker forced closed");
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    consecutive_failures_ = 0;
    trials_issued_ = 0;
    open_since_ = {};
    total_successes_ = 0;
    total_failures_ = 0;
    times_opened_ = 0;
    rejected_ = 0;
}

}  // namespace agentrelay::memory
