#include "agentrelay/session/session_arbiter.hpp"
#include "agentrelay/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentrelay::session {

// TurnRequest
Result<TurnRequest, Error> TurnRequest::from_json(const Json& j, const TurnRequest& defaults) {
    if (!j.is_object()) {
        return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument, "Request must be a JSON object");
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument, "Request needs a \"text\" string");
    }

    TurnRequest request = defaults;
    try {
        request.text = j["text"].get<std::string>();
        request.context_id = j.value("context", defaults.context_id);
        request.destination = j.value("destination", defaults.destination);
        request.exempt_quiet_hours = j.value("exempt_quiet_hours", defaults.exempt_quiet_hours);
        request.raw = j.value("raw", defaults.raw);

        if (j.contains("requester")) {
            auto requester = j["requester"].get<std::string>();
            if (requester != "conversational" && requester != "scheduled_job") {
                return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument,
                                                       "Unknown requester", requester);
            }
            request.requester = requester_from_string(requester);
        }
    } catch (const Json::exception& e) {
        return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument, e.what());
    }

    if (request.text.empty()) {
        return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument, "Request text is empty");
    }
    if (request.context_id.empty()) {
        return Result<TurnRequest, Error>::err(ErrorCode::InvalidArgument, "Request context is empty");
    }
    return Result<TurnRequest, Error>::ok(std::move(request));
}

// TurnResult
Json TurnResult::to_json() const {
    Json j{
        {"turn_id", turn_id},
        {"outcome", std::string(outcome_to_string(outcome))},
        {"text", text},
        {"leak_detected", leak_detected},
        {"polls", polls},
        {"strategy", strategy}
    };
    if (error) {
        j["error"] = error->full_message();
        j["error_code"] = static_cast<int>(error->code);
    }
    return j;
}

// SessionArbiter
SessionArbiter::SessionArbiter(const Config& config,
                               Terminal& terminal,
                               const response::PatternLibrary& patterns,
                               ArbiterServices services)
    : config_(config)
    , terminal_(terminal)
    , patterns_(patterns)
    , services_(services)
    , classifier_(patterns_, config.poller.classify_tail_lines)
    , extractor_(patterns_)
    , sanitizer_(patterns_)
    , composer_(config.composer)
    , recent_(static_cast<size_t>(std::max(0, config.composer.recent_capacity)),
              static_cast<size_t>(std::max(0, config.composer.recent_entry_max_chars)))
    , lock_(Duration(config.arbiter.max_hold_ms))
{
    handle_.name = terminal_.name();
    handle_.last_activity = Clock::now();
}

PollOptions SessionArbiter::poll_options() const {
    auto options = PollOptions::from_config(config_.poller);
    // A turn must never hold the session past max_hold
    options.timeout = std::min(options.timeout, lock_.max_hold());
    return options;
}

TurnResult SessionArbiter::run_turn(const TurnRequest& request) {
    TurnResult result;
    result.turn_id = generate_turn_id();

    if (shutdown_.load()) {
        spdlog::info("Turn {} refused: relay is shutting down", result.turn_id);
        result.outcome = TurnOutcome::Errored;
        result.error = Error{ErrorCode::Cancelled, "Relay is shutting down"};
        deliver(request, result);
        return result;
    }

    spdlog::info("Turn {} from {} (context {}, {} bytes{})",
                 result.turn_id, requester_to_string(request.requester), request.context_id,
                 request.text.size(), request.exempt_quiet_hours ? ", exempt from quiet hours" : "");

    // Fetched before queueing for the lock so a slow memory store never holds the session
    std::string memory_context;
    if (services_.memory_context != nullptr) {
        memory_context = services_.memory_context->fetch(request.text);
    }

    auto guard = lock_.try_acquire(Duration(config_.arbiter.lock_timeout_ms), result.turn_id);
    if (!guard) {
        ++busy_;
        spdlog::info("Turn {} rejected: session busy (held by {})",
                     result.turn_id, lock_.holder().value_or("?"));
        result.outcome = TurnOutcome::Busy;
        deliver(request, result);
        return result;
    }

    std::unique_ptr<SessionStateFile::Lock> shared_lock;
    if (services_.shared_state != nullptr) {
        auto locked = services_.shared_state->lock(Duration(config_.arbiter.lock_timeout_ms));
        if (locked.is_err()) {
            guard->release();
            ++busy_;
            spdlog::info("Turn {} rejected: {}", result.turn_id, locked.error().full_message());
            result.outcome = TurnOutcome::Busy;
            result.error = locked.error();
            deliver(request, result);
            return result;
        }
        shared_lock = std::move(locked).value();
        load_shared_state();
    }
    ++turns_;

    memory::CaptureRecord record;
    record.id = generate_capture_id();
    record.turn_id = result.turn_id;
    record.requester = request.requester;
    record.context_id = request.context_id;
    record.destination = request.destination;
    record.request = request.text;
    record.started_at = Clock::now();

    try {
        execute(request, memory_context, record, result);
    } catch (const std::exception& e) {
        spdlog::error("Turn {} aborted: {}", result.turn_id, e.what());
        result.outcome = TurnOutcome::Errored;
        result.error = Error::from_exception(e);
    }

    if (shared_lock) {
        save_shared_state(result.turn_id);
        shared_lock.reset();
    }
    guard->release();

    record.final_state = result.outcome;
    record.ended_at = Clock::now();
    if (result.error) {
        record.error = result.error->full_message();
    }

    auto elapsed = std::chrono::duration_cast<Duration>(record.ended_at - record.started_at);
    spdlog::info("Turn {} finished: {} after {} polls, {}ms",
                 result.turn_id, outcome_to_string(result.outcome), result.polls, elapsed.count());

    if (services_.forwarder != nullptr) {
        services_.forwarder->submit(std::move(record));
    }

    deliver(request, result);
    return result;
}

void SessionArbiter::execute(const TurnRequest& request,
                             const std::string& memory_context,
                             memory::CaptureRecord& record,
                             TurnResult& result)
{
    auto running = terminal_.ensure_running();
    if (running.is_err()) {
        result.outcome = TurnOutcome::Errored;
        result.error = running.error();
        return;
    }

    ContextId loaded;
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        if (running.value()) {
            spdlog::info("Session {} was (re)started, resetting handle", terminal_.name());
            handle_ = SessionHandle{terminal_.name(), "", Clock::now()};
        }
        loaded = handle_.loaded_context;
    }

    if (!loaded.empty() && loaded != request.context_id) {
        auto reset = reset_context(loaded, request.context_id);
        if (reset.is_err()) {
            result.outcome = TurnOutcome::ContextResetFailed;
            result.error = reset.error();
            return;
        }
    }

    int retries = std::max(0, config_.arbiter.empty_response_retries);
    for (int i = 0; i <= retries; ++i) {
        if (i > 0) {
            spdlog::warn("Turn {} produced no response, retrying ({}/{})", result.turn_id, i, retries);
            auto interrupted = terminal_.interrupt();
            if (interrupted.is_err()) {
                spdlog::warn("Interrupt failed: {}", interrupted.error().full_message());
            }
        }
        if (!attempt(request, memory_context, record, result)) {
            break;
        }
    }

    if (result.outcome != TurnOutcome::Completed) {
        return;
    }

    auto now = Clock::now();
    recent_.append(request.context_id, context::Exchange{request.text, result.text, request.requester, now});

    std::lock_guard<std::mutex> lock(handle_mutex_);
    handle_.last_activity = now;
}

bool SessionArbiter::attempt(const TurnRequest& request,
                             const std::string& memory_context,
                             memory::CaptureRecord& record,
                             TurnResult& result)
{
    std::optional<std::string> sentinel;
    if (config_.arbiter.use_markers) {
        sentinel = generate_sentinel();
    }

    auto recent = recent_.entries(request.context_id);
    auto submission = composer_.compose(memory_context, recent, request.text, sentinel, request.destination);
    if (submission.is_err()) {
        result.outcome = TurnOutcome::Errored;
        result.error = submission.error();
        return false;
    }
    record.prompt = submission.value().text;

    Poller poller(terminal_, classifier_, poll_options());
    auto before = poller.submit(submission.value().text);
    if (before.is_err()) {
        result.outcome = TurnOutcome::Errored;
        result.error = before.error();
        return false;
    }

    {
        // Whatever happens next, the session now holds this context
        std::lock_guard<std::mutex> lock(handle_mutex_);
        handle_.loaded_context = request.context_id;
        handle_.last_activity = Clock::now();
    }

    ProgressCallback progress;
    if (request.progress) {
        progress = [&request](Duration elapsed) { request.progress(elapsed); };
    }

    auto outcome = poller.wait_for_completion(&shutdown_, progress);
    result.polls += outcome.polls;

    record.capture_before = before.value();
    record.capture_after = outcome.capture;

    if (!outcome.capture.empty()) {
        auto extraction = extractor_.extract(before.value(), outcome.capture, sentinel);
        if (sentinel && extraction.strategy == response::ExtractionStrategy::DiffFallback) {
            spdlog::warn("Turn {}: sentinel {} not on screen, using diff extraction", result.turn_id, *sentinel);
        }

        auto sanitized = sanitizer_.sanitize(extraction.text, request.raw);
        if (sanitized.leak_detected) {
            spdlog::warn("Turn {}: removed leaked lines ({} rules)", result.turn_id, sanitized.rules_applied.size());
        }

        record.extracted = extraction.text;
        record.sanitized = sanitized.text;
        record.leak_detected = sanitized.leak_detected;
        record.rules_applied = sanitized.rules_applied;
        record.strategy = std::string(response::strategy_to_string(extraction.strategy));

        result.text = sanitized.text;
        result.leak_detected = sanitized.leak_detected;
        result.strategy = record.strategy;
    }

    switch (outcome.state) {
        case PollState::Completed:
            if (result.text.empty()) {
                result.outcome = TurnOutcome::EmptyResponse;
                return true;
            }
            result.outcome = TurnOutcome::Completed;
            return false;
        case PollState::PermissionRequested:
            result.outcome = TurnOutcome::PermissionRequested;
            return false;
        case PollState::TimedOut:
            result.outcome = TurnOutcome::TimedOut;
            return false;
        case PollState::Cancelled:
            result.outcome = TurnOutcome::Errored;
            result.error = Error{ErrorCode::Cancelled, "Turn cancelled during poll"};
            return false;
        case PollState::Errored:
            result.outcome = TurnOutcome::Errored;
            result.error = outcome.error.value_or(Error{ErrorCode::InvalidState, "Session shows an error"});
            return false;
    }
    return false;
}

Result<void, Error> SessionArbiter::reset_context(const ContextId& from, const ContextId& to) {
    spdlog::info("Switching session context {} -> {}", from, to);

    auto sent = terminal_.send_text(config_.arbiter.context_reset_command);
    if (sent.is_err()) {
        return Result<void, Error>::err(ErrorCode::ContextResetFailed,
                                        "Reset command not sent: " + sent.error().message);
    }

    Poller poller(terminal_, classifier_, poll_options());
    auto outcome = poller.wait_for_completion(Duration(config_.arbiter.context_reset_timeout_ms), &shutdown_);
    if (outcome.state != PollState::Completed) {
        spdlog::error("Context reset did not settle: {}", poll_state_to_string(outcome.state));
        return Result<void, Error>::err(ErrorCode::ContextResetFailed,
                                        "Session did not return to idle after reset",
                                        std::string(poll_state_to_string(outcome.state)));
    }

    std::lock_guard<std::mutex> lock(handle_mutex_);
    handle_.loaded_context.clear();
    return Result<void, Error>::ok();
}

void SessionArbiter::load_shared_state() {
    auto loaded = services_.shared_state->load();
    if (loaded.is_err()) {
        // Unknown context: the next switch is decided as for a fresh session
        spdlog::warn("Session state unreadable, assuming nothing loaded: {}", loaded.error().full_message());
        std::lock_guard<std::mutex> lock(handle_mutex_);
        handle_.loaded_context.clear();
        return;
    }

    std::lock_guard<std::mutex> lock(handle_mutex_);
    if (handle_.loaded_context != loaded.value().loaded_context) {
        spdlog::debug("Session context changed elsewhere: '{}' -> '{}'",
                      handle_.loaded_context, loaded.value().loaded_context);
        handle_.loaded_context = loaded.value().loaded_context;
    }
}

void SessionArbiter::save_shared_state(const TurnId& turn_id) {
    SharedSessionState state;
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        state.loaded_context = handle_.loaded_context;
    }
    state.last_turn = turn_id;
    state.updated_at = Clock::now();

    auto saved = services_.shared_state->save(state);
    if (saved.is_err()) {
        spdlog::error("Failed to save session state: {}", saved.error().full_message());
    }
}

void SessionArbiter::deliver(const TurnRequest& request, const TurnResult& result) const {
    if (!request.deliver) {
        return;
    }
    try {
        request.deliver(result);
    } catch (const std::exception& e) {
        spdlog::error("Delivery of turn {} failed: {}", result.turn_id, e.what());
    }
}

SessionHandle SessionArbiter::handle() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return handle_;
}

// Only touches an atomic so it can be called from a signal handler
void SessionArbiter::shutdown() {
    shutdown_.store(true);
}

Json SessionArbiter::status() const {
    auto current = handle();

    Json j;
    j["session"] = current.name;
    j["loaded_context"] = current.loaded_context;
    j["last_activity"] = to_millis(current.last_activity);
    j["lock_held"] = lock_.is_held();
    j["lock_holder"] = lock_.holder().value_or("");
    j["lock_overdue"] = lock_.overdue();
    j["waiting"] = lock_.waiting();
    j["turns"] = turns_.load();
    j["busy"] = busy_.load();
    j["shutting_down"] = shutdown_.load();

    if (services_.breaker != nullptr) {
        j["breaker"] = services_.breaker->stats().to_json();
    }
    if (services_.retry_queue != nullptr) {
        j["retry_queue"] = services_.retry_queue->stats().to_json();
    }
    return j;
}

}  // namespace agentrelay::session
