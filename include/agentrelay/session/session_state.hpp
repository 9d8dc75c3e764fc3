#pragma once

#include "agentrelay/core/result.hpp"
#include "agentrelay/core/types.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace agentrelay::session {

using namespace agentrelay::core;
namespace fs = std::filesystem;

// What every relay process driving the session needs to agree on
struct SharedSessionState {
    ContextId loaded_context;  // empty when unknown or freshly started
    TurnId last_turn;
    TimePoint updated_at;

    Json to_json() const;
    static SharedSessionState from_json(const Json& j);
};

// Cross-process side of the session lock, kept in data_dir:
//   session.lock        flock(2) held for the whole turn
//   session_state.json  loaded context after the last turn
// One-shot relay processes and the long-running one serialize through it.
class SessionStateFile {
public:
    // Exclusive hold on session.lock, dropped on destruction
    class Lock {
    public:
        explicit Lock(int fd) : fd_(fd) {}
        ~Lock();

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        int fd_;
    };

    explicit SessionStateFile(const fs::path& data_dir);

    // Waits up to timeout; LockTimeout while another holder keeps it
    Result<std::unique_ptr<Lock>, Error> lock(Duration timeout) const;

    // A missing file is an empty state
    Result<SharedSessionState, Error> load() const;
    Result<void, Error> save(const SharedSessionState& state) const;

    const fs::path& lock_path() const { return lock_path_; }
    const fs::path& state_path() const { return state_path_; }

private:
    fs::path lock_path_;
    fs::path state_path_;
};

}  // namespace agentrelay::session
