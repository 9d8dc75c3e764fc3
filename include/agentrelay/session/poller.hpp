#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/response/state_classifier.hpp"
#include "terminal.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace agentrelay::session {

using namespace agentrelay::core;

enum class PollState {
    Completed,            // Idle and stable
    PermissionRequested,
    Errored,              // stable error screen, or the session could not be captured
    TimedOut,
    Cancelled
};

std::string_view poll_state_to_string(PollState state);

struct PollOutcome {
    PollState state = PollState::TimedOut;
    std::string capture;  // last capture seen
    ScreenState screen = ScreenState::Unknown;
    int polls = 0;
    Duration elapsed{0};
    std::optional<Error> error;
};

struct PollOptions {
    Duration interval{500};
    Duration timeout{60000};
    int stability_threshold = 3;
    Duration interim_delay{5000};
    Duration interim_interval{10000};

    static PollOptions from_config(const PollerConfig& config);
};

// Called while a long poll is still running
using ProgressCallback = std::function<void(Duration elapsed)>;

class Poller {
public:
    Poller(Terminal& terminal, const response::StateClassifier& classifier, PollOptions options);

    // Send the prompt and return the screen as it was just before sending
    Result<std::string, Error> submit(const std::string& prompt);

    // Poll until Idle has been seen on `stability_threshold` identical captures in a row,
    // a permission prompt appears, the timeout passes, or `cancel` is set
    PollOutcome wait_for_completion(Duration timeout,
                                    const std::atomic<bool>* cancel = nullptr,
                                    const ProgressCallback& progress = nullptr);

    PollOutcome wait_for_completion(const std::atomic<bool>* cancel = nullptr,
                                    const ProgressCallback& progress = nullptr) {
        return wait_for_completion(options_.timeout, cancel, progress);
    }

    const PollOptions& options() const { return options_; }

private:
    Terminal& terminal_;
    const response::StateClassifier& classifier_;
    PollOptions options_;

    // Sleep one interval in short slices; false when cancelled
    bool sleep_interval(const std::atomic<bool>* cancel) const;
};

}  // namespace agentrelay::session
