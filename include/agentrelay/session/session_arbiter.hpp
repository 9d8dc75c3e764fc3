#pragma once

#include "agentrelay/context/context_composer.hpp"
#include "agentrelay/context/memory_context_provider.hpp"
#include "agentrelay/context/recent_buffer.hpp"
#include "agentrelay/core/config.hpp"
#include "agentrelay/memory/capture_forwarder.hpp"
#include "agentrelay/memory/circuit_breaker.hpp"
#include "agentrelay/memory/retry_queue.hpp"
#include "agentrelay/response/response_extractor.hpp"
#include "agentrelay/response/sanitizer.hpp"
#include "agentrelay/response/state_classifier.hpp"
#include "poller.hpp"
#include "session_lock.hpp"
#include "session_state.hpp"
#include "terminal.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace agentrelay::session {

using namespace agentrelay::core;

struct TurnResult;

// One request for the session, from the chat layer or the job scheduler
struct TurnRequest {
    RequesterKind requester = RequesterKind::Conversational;
    ContextId context_id = "default";
    std::string destination;
    std::string text;
    bool exempt_quiet_hours = false;  // decided by the scheduler, carried only
    bool raw = false;

    std::function<void(Duration elapsed)> progress;
    std::function<void(const TurnResult&)> deliver;

    // {"text", "context", "requester", "destination", "exempt_quiet_hours", "raw"};
    // only text is required, the rest fall back to `defaults`
    static Result<TurnRequest, Error> from_json(const Json& j, const TurnRequest& defaults);
};

struct TurnResult {
    TurnOutcome outcome = TurnOutcome::Errored;
    std::string text;
    TurnId turn_id;
    bool leak_detected = false;
    std::optional<Error> error;
    int polls = 0;
    std::string strategy;

    bool ok() const { return outcome == TurnOutcome::Completed; }

    Json to_json() const;
};

// The single interactive session as seen by the relay
struct SessionHandle {
    std::string name;
    ContextId loaded_context;  // empty for a freshly started session
    TimePoint last_activity;
};

// Collaborators the arbiter reports on or hands records to; all optional
struct ArbiterServices {
    context::MemoryContextProvider* memory_context = nullptr;
    memory::CaptureForwarder* forwarder = nullptr;
    const memory::CircuitBreaker* breaker = nullptr;
    const memory::RetryQueue* retry_queue = nullptr;
    const SessionStateFile* shared_state = nullptr;  // set when other processes may drive the session
};

// Owns the session and runs turns through it one at a time:
// fetch memory context -> lock -> ensure running -> context reset -> compose -> submit -> poll
// -> extract -> sanitize -> deliver -> release -> record
class SessionArbiter {
public:
    SessionArbiter(const Config& config,
                   Terminal& terminal,
                   const response::PatternLibrary& patterns,
                   ArbiterServices services = {});

    SessionArbiter(const SessionArbiter&) = delete;
    SessionArbiter& operator=(const SessionArbiter&) = delete;

    TurnResult run_turn(const TurnRequest& request);

    Json status() const;

    // Cancels the in-flight poll and refuses new turns
    void shutdown();
    bool shutting_down() const { return shutdown_.load(); }

    SessionHandle handle() const;
    const SessionLock& lock() const { return lock_; }
    context::RecentBuffer& recent() { return recent_; }

private:
    Config config_;
    Terminal& terminal_;
    const response::PatternLibrary& patterns_;
    ArbiterServices services_;

    response::StateClassifier classifier_;
    response::ResponseExtractor extractor_;
    response::Sanitizer sanitizer_;
    context::ContextComposer composer_;
    context::RecentBuffer recent_;

    SessionLock lock_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex handle_mutex_;
    SessionHandle handle_;

    std::atomic<uint64_t> turns_{0};
    std::atomic<uint64_t> busy_{0};

    // Everything between acquiring and releasing the lock
    void execute(const TurnRequest& request,
                 const std::string& memory_context,
                 memory::CaptureRecord& record,
                 TurnResult& result);

    Result<void, Error> reset_context(const ContextId& from, const ContextId& to);

    // One submit/poll/extract/sanitize pass; false when the turn is over
    bool attempt(const TurnRequest& request,
                 const std::string& memory_context,
                 memory::CaptureRecord& record,
                 TurnResult& result);

    // Adopt / publish the loaded context other processes left behind
    void load_shared_state();
    void save_shared_state(const TurnId& turn_id);

    PollOptions poll_options() const;
    void deliver(const TurnRequest& request, const TurnResult& result) const;
};

}  // namespace agentrelay::session
