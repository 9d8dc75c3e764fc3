#pragma once

#include <string>
#include <vector>

namespace agentrelay::session {

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool spawn_failed = false;

    bool ok() const { return !spawn_failed && !timed_out && exit_code == 0; }
};

// Run argv[0] with the given arguments (no shell), feeding `input` on stdin.
// The child is killed when `timeout_ms` elapses.
ProcessResult run_process(const std::vector<std::string>& argv,
                          int timeout_ms,
                          const std::string& input = "");

}  // namespace agentrelay::session
