#pragma once

#include "agentrelay/core/types.hpp"

#include <string>
#include <vector>

namespace agentrelay::memory {

using namespace agentrelay::core;

// A finished turn plus its raw screen captures. Never modified once written.
struct CaptureRecord {
    CaptureId id;
    TurnId turn_id;
    RequesterKind requester = RequesterKind::Conversational;
    ContextId context_id;
    std::string destination;

    std::string request;  // the requester's own message
    std::string prompt;   // what was typed into the session
    std::string capture_before;
    std::string capture_after;
    std::string extracted;
    std::string sanitized;

    TurnOutcome final_state = TurnOutcome::Errored;
    bool leak_detected = false;
    std::vector<std::string> rules_applied;
    std::string strategy;
    std::string error;

    TimePoint started_at;
    TimePoint ended_at;

    bool failed() const { return final_state != TurnOutcome::Completed; }

    Json to_json() const;
    static CaptureRecord from_json(const Json& j);
};

}  // namespace agentrelay::memory
