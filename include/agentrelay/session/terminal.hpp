#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/core/result.hpp"

#include <string>

namespace agentrelay::session {

using namespace agentrelay::core;

// Screen capture and input for the interactive session
class Terminal {
public:
    virtual ~Terminal() = default;

    virtual const std::string& name() const = 0;

    virtual bool exists() = 0;

    // Start the session when it is not running. Ok(true) means it was (re)started.
    virtual Result<bool, Error> ensure_running() = 0;

    // Current visible contents plus recent scrollback
    virtual Result<std::string, Error> capture() = 0;

    // Type text literally, then press Enter
    virtual Result<void, Error> send_text(const std::string& text) = 0;

    // Send a named key such as "Enter" or "C-c"
    virtual Result<void, Error> send_key(const std::string& key) = 0;

    Result<void, Error> interrupt() { return send_key("C-c"); }
};

// Terminal backed by a detached tmux session
class TmuxTerminal : public Terminal {
public:
    explicit TmuxTerminal(const SessionConfig& config);

    const std::string& name() const override { return config_.name; }

    bool exists() override;
    Result<bool, Error> ensure_running() override;
    Result<std::string, Error> capture() override;
    Result<void, Error> send_text(const std::string& text) override;
    Result<void, Error> send_key(const std::string& key) override;

private:
    SessionConfig config_;
    std::string buffer_name_;
};

}  // namespace agentrelay::session
