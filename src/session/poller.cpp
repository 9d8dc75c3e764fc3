#include "agentrelay/session/poller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace agentrelay::session {

namespace {

constexpr int kMaxCaptureFailures = 3;
constexpr Duration kSleepSlice{50};

bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

}  // namespace

std::string_view poll_state_to_string(PollState state) {
    switch (state) {
        case PollState::Completed: return "completed";
        case PollState::PermissionRequested: return "permission_requested";
        case PollState::Errored: return "errored";
        case PollState::TimedOut: return "timed_out";
        case PollState::Cancelled: return "cancelled";
    }
    return "unknown";
}

PollOptions PollOptions::from_config(const PollerConfig& config) {
    PollOptions options;
    options.interval = Duration{config.interval_ms};
    options.timeout = Duration{config.timeout_ms};
    options.stability_threshold = std::max(1, config.stability_threshold);
    options.interim_delay = Duration{config.interim_delay_ms};
    options.interim_interval = Duration{std::max(1, config.interim_interval_ms)};
    return options;
}

Poller::Poller(Terminal& terminal, const response::StateClassifier& classifier, PollOptions options)
    : terminal_(terminal)
    , classifier_(classifier)
    , options_(options)
{
}

Result<std::string, Error> Poller::submit(const std::string& prompt) {
    auto before = terminal_.capture();
    if (before.is_err()) {
        return before;
    }

    auto sent = terminal_.send_text(prompt);
    if (sent.is_err()) {
        return Result<std::string, Error>::err(std::move(sent).error());
    }

    spdlog::debug("Submitted {} bytes to {}", prompt.size(), terminal_.name());
    return before;
}

bool Poller::sleep_interval(const std::atomic<bool>* cancel) const {
    auto remaining = options_.interval;
    while (remaining.count() > 0) {
        if (cancelled(cancel)) {
            return false;
        }
        auto slice = std::min(remaining, kSleepSlice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !cancelled(cancel);
}

PollOutcome Poller::wait_for_completion(Duration timeout,
                                        const std::atomic<bool>* cancel,
                                        const ProgressCallback& progress)
{
    PollOutcome outcome;
    const auto start = SteadyClock::now();
    auto next_interim = options_.interim_delay;

    std::optional<std::string> previous;
    int stable_run = 0;
    int capture_failures = 0;

    auto elapsed = [&start] {
        return std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
    };

    while (true) {
        if (!sleep_interval(cancel)) {
            outcome.state = PollState::Cancelled;
            break;
        }

        auto captured = terminal_.capture();
        if (captured.is_err()) {
            spdlog::warn("Capture failed on {}: {}", terminal_.name(), captured.error().full_message());
            if (++capture_failures >= kMaxCaptureFailures) {
                outcome.state = PollState::Errored;
                outcome.error = captured.error();
                break;
            }
        } else {
            capture_failures = 0;
            ++outcome.polls;

            // Run length of identical captures, including this one
            std::string& capture = captured.value();
            stable_run = (previous && *previous == capture) ? stable_run + 1 : 1;
            previous = capture;
            outcome.capture = std::move(capture);
            outcome.screen = classifier_.classify(outcome.capture);

            if (outcome.screen == ScreenState::PermissionRequested) {
                outcome.state = PollState::PermissionRequested;
                break;
            }
            if (stable_run >= options_.stability_threshold) {
                if (outcome.screen == ScreenState::Idle) {
                    outcome.state = PollState::Completed;
                    break;
                }
                if (outcome.screen == ScreenState::Error) {
                    outcome.state = PollState::Errored;
                    outcome.error = Error{ErrorCode::InvalidState, "Session shows an error", terminal_.name()};
                    break;
                }
            }
        }

        auto now = elapsed();
        if (now >= timeout) {
            outcome.state = PollState::TimedOut;
            break;
        }

        if (progress && now >= next_interim) {
            progress(now);
            next_interim = now + options_.interim_interval;
        }
    }

    outcome.elapsed = elapsed();
    spdlog::debug("Poll on {} ended {} after {} polls ({}ms, screen {})",
                  terminal_.name(), poll_state_to_string(outcome.state), outcome.polls,
                  outcome.elapsed.count(), screen_state_to_string(outcome.screen));
    return outcome;
}

}  // namespace agentrelay::session
