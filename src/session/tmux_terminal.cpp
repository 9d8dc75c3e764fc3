#include "agentrelay/session/terminal.hpp"
#include "agentrelay/session/process.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace agentrelay::session {

namespace {

// tmux missing or not executable is reported as such, not as the step that failed
Error command_error(const ProcessResult& result, ErrorCode code, const std::string& what,
                    const std::string& session) {
    if (result.spawn_failed) {
        return Error{ErrorCode::ProcessSpawnFailed, what + ": " + result.stderr_output, session};
    }
    if (result.timed_out) {
        return Error{code, what + " timed out", session};
    }
    return Error{code, what + " failed: " + result.stderr_output, session};
}

}  // namespace

TmuxTerminal::TmuxTerminal(const SessionConfig& config)
    : config_(config)
    , buffer_name_("agentrelay-" + config.name)
{
}

bool TmuxTerminal::exists() {
    auto result = run_process({config_.tmux_binary, "has-session", "-t", config_.name},
                               config_.command_timeout_ms);
    return result.ok();
}

Result<bool, Error> TmuxTerminal::ensure_running() {
    if (exists()) {
        return Result<bool, Error>::ok(false);
    }

    if (!config_.auto_start) {
        return Result<bool, Error>::err(ErrorCode::SessionNotRunning,
                                        "Session is not running and auto_start is off",
                                        config_.name);
    }

    spdlog::info("Starting session {} ({}) in {}", config_.name, config_.start_command,
                 config_.working_dir.string());

    auto result = run_process({config_.tmux_binary, "new-session", "-d",
                               "-s", config_.name,
                               "-c", config_.working_dir.string(),
                               "-x", "200", "-y", "50",
                               config_.start_command},
                              config_.command_timeout_ms);
    if (!result.ok()) {
        return Result<bool, Error>::err(
            command_error(result, ErrorCode::SessionStartFailed, "new-session", config_.name));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.startup_wait_ms));
    return Result<bool, Error>::ok(true);
}

Result<std::string, Error> TmuxTerminal::capture() {
    auto result = run_process({config_.tmux_binary, "capture-pane", "-p", "-J",
                               "-t", config_.name,
                               "-S", "-" + std::to_string(config_.capture_lines)},
                              config_.command_timeout_ms);
    if (!result.ok()) {
        return Result<std::string, Error>::err(
            command_error(result, ErrorCode::CaptureFailed, "capture-pane", config_.name));
    }
    return Result<std::string, Error>::ok(std::move(result.stdout_output));
}

Result<void, Error> TmuxTerminal::send_text(const std::string& text) {
    // load-buffer + paste-buffer keeps the text literal and avoids send-keys length limits
    auto load = run_process({config_.tmux_binary, "load-buffer", "-b", buffer_name_, "-"},
                            config_.command_timeout_ms, text);
    if (!load.ok()) {
        return Result<void, Error>::err(
            command_error(load, ErrorCode::SubmitFailed, "load-buffer", config_.name));
    }

    auto paste = run_process({config_.tmux_binary, "paste-buffer", "-d", "-p",
                              "-b", buffer_name_, "-t", config_.name},
                             config_.command_timeout_ms);
    if (!paste.ok()) {
        return Result<void, Error>::err(
            command_error(paste, ErrorCode::SubmitFailed, "paste-buffer", config_.name));
    }

    // Give the input box a moment to take the paste before submitting
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return send_key("Enter");
}

Result<void, Error> TmuxTerminal::send_key(const std::string& key) {
    auto result = run_process({config_.tmux_binary, "send-keys", "-t", config_.name, key},
                              config_.command_timeout_ms);
    if (!result.ok()) {
        return Result<void, Error>::err(
            command_error(result, ErrorCode::SubmitFailed, "send-keys " + key, config_.name));
    }
    return Result<void, Error>::ok();
}

}  // namespace agentrelay::session
