#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace agentrelay::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;

// Common type aliases
using TurnId = std::string;
using CaptureId = std::string;
using ContextId = std::string;

inline int64_t to_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint from_millis(int64_t ms) {
    return TimePoint{std::chrono::milliseconds{ms}};
}

// Who asked for a turn
enum class RequesterKind {
    Conversational,
    ScheduledJob
};

inline std::string_view requester_to_string(RequesterKind kind) {
    switch (kind) {
        case RequesterKind::Conversational: return "conversational";
        case RequesterKind::ScheduledJob: return "scheduled_job";
    }
    return "unknown";
}

inline RequesterKind requester_from_string(std::string_view str) {
    if (str == "scheduled_job") return RequesterKind::ScheduledJob;
    return RequesterKind::Conversational;
}

// What the screen of the interactive session currently shows
enum class ScreenState {
    Idle,
    Working,
    PermissionRequested,
    Error,
    Unknown
};

inline std::string_view screen_state_to_string(ScreenState state) {
    switch (state) {
        case ScreenState::Idle: return "idle";
        case ScreenState::Working: return "working";
        case ScreenState::PermissionRequested: return "permission_requested";
        case ScreenState::Error: return "error";
        case ScreenState::Unknown: return "unknown";
    }
    return "unknown";
}

// Final outcome of a turn
enum class TurnOutcome {
    Completed,
    Busy,
    TimedOut,
    PermissionRequested,
    EmptyResponse,
    ContextResetFailed,
    Errored
};

inline std::string_view outcome_to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Completed: return "completed";
        case TurnOutcome::Busy: return "busy";
        case TurnOutcome::TimedOut: return "timed_out";
        case TurnOutcome::PermissionRequested: return "permission_requested";
        case TurnOutcome::EmptyResponse: return "empty_response";
        case TurnOutcome::ContextResetFailed: return "context_reset_failed";
        case TurnOutcome::Errored: return "errored";
    }
    return "errored";
}

inline TurnOutcome outcome_from_string(std::string_view str) {
    if (str == "completed") return TurnOutcome::Completed;
    if (str == "busy") return TurnOutcome::Busy;
    if (str == "timed_out") return TurnOutcome::TimedOut;
    if (str == "permission_requested") return TurnOutcome::PermissionRequested;
    if (str == "empty_response") return TurnOutcome::EmptyResponse;
    if (str == "context_reset_failed") return TurnOutcome::ContextResetFailed;
    return TurnOutcome::Errored;
}

}  // namespace agentrelay::core
