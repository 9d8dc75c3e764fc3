#include "agentrelay/memory/capture_record.hpp"

namespace agentrelay::memory {

Json CaptureRecord::to_json() const {
    Json j{
        {"id", id},
        {"turn_id", turn_id},
        {"requester", std::string(requester_to_string(requester))},
        {"context_id", context_id},
        {"destination", destination},
        {"request", request},
        {"prompt", prompt},
        {"capture_before", capture_before},
        {"capture_after", capture_after},
        {"extracted", extracted},
        {"sanitized", sanitized},
        {"final_state", std::string(outcome_to_string(final_state))},
        {"leak_detected", leak_detected},
        {"rules_applied", rules_applied},
        {"strategy", strategy},
        {"started_at", to_millis(started_at)},
        {"ended_at", to_millis(ended_at)}
    };

    if (!error.empty()) {
        j["error"] = error;
    }

    return j;
}

CaptureRecord CaptureRecord::from_json(const Json& j) {
    CaptureRecord record;
    record.id = j.value("id", "");
    record.turn_id = j.value("turn_id", "");
    record.requester = requester_from_string(j.value("requester", "conversational"));
    record.context_id = j.value("context_id", "");
    record.destination = j.value("destination", "");
    record.request = j.value("request", "");
    record.prompt = j.value("prompt", "");
    record.capture_before = j.value("capture_before", "");
    record.capture_after = j.value("capture_after", "");
    record.extracted = j.value("extracted", "");
    record.sanitized = j.value("sanitized", "");
    record.final_state = outcome_from_string(j.value("final_state", "errored"));
    record.leak_detected = j.value("leak_detected", false);
    record.strategy = j.value("strategy", "");
    record.error = j.value("error", "");

    if (j.contains("rules_applied")) {
        record.rules_applied = j["rules_applied"].get<std::vector<std::string>>();
    }
    if (j.contains("started_at")) {
        record.started_at = from_millis(j["started_at"].get<int64_t>());
    }
    if (j.contains("ended_at")) {
        record.ended_at = from_millis(j["ended_at"].get<int64_t>());
    }

    return record;
}

}  // namespace agentrelay::memory
