#include "agentrelay/session/session_state.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace agentrelay::session {

namespace {

constexpr Duration kLockRetry{20};

}  // namespace

// SharedSessionState
Json SharedSessionState::to_json() const {
    return Json{
        {"loaded_context", loaded_context},
        {"last_turn", last_turn},
        {"updated_at", to_millis(updated_at)}
    };
}

SharedSessionState SharedSessionState::from_json(const Json& j) {
    SharedSessionState state;
    state.loaded_context = j.value("loaded_context", "");
    state.last_turn = j.value("last_turn", "");
    state.updated_at = from_millis(j.value("updated_at", int64_t{0}));
    return state;
}

// SessionStateFile
SessionStateFile::Lock::~Lock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

SessionStateFile::SessionStateFile(const fs::path& data_dir)
    : lock_path_(data_dir / "session.lock")
    , state_path_(data_dir / "session_state.json")
{
}

Result<std::unique_ptr<SessionStateFile::Lock>, Error> SessionStateFile::lock(Duration timeout) const {
    using LockResult = Result<std::unique_ptr<Lock>, Error>;

    std::error_code ec;
    fs::create_directories(lock_path_.parent_path(), ec);

    int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return LockResult::err(ErrorCode::FileWriteFailed, std::strerror(errno), lock_path_.string());
    }

    auto deadline = SteadyClock::now() + timeout;
    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        if (error != EWOULDBLOCK && error != EINTR) {
            ::close(fd);
            return LockResult::err(ErrorCode::FileWriteFailed, std::strerror(error), lock_path_.string());
        }
        if (SteadyClock::now() >= deadline) {
            ::close(fd);
            return LockResult::err(ErrorCode::LockTimeout,
                                   "Session is held by another relay process", lock_path_.string());
        }
        std::this_thread::sleep_for(kLockRetry);
    }

    return LockResult::ok(std::make_unique<Lock>(fd));
}

Result<SharedSessionState, Error> SessionStateFile::load() const {
    if (!fs::exists(state_path_)) {
        return Result<SharedSessionState, Error>::ok(SharedSessionState{});
    }

    std::ifstream file(state_path_);
    if (!file) {
        return Result<SharedSessionState, Error>::err(
            ErrorCode::FileReadFailed, "Failed to open session state", state_path_.string());
    }

    try {
        return Result<SharedSessionState, Error>::ok(SharedSessionState::from_json(Json::parse(file)));
    } catch (const Json::exception& e) {
        return Result<SharedSessionState, Error>::err(ErrorCode::StoreCorrupted, e.what(), state_path_.string());
    }
}

Result<void, Error> SessionStateFile::save(const SharedSessionState& state) const {
    try {
        fs::create_directories(state_path_.parent_path());

        fs::path tmp = state_path_;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                return Result<void, Error>::err(ErrorCode::FileWriteFailed, "Failed to save session state", tmp.string());
            }
            file << state.to_json().dump(2);
        }
        fs::rename(tmp, state_path_);
        spdlog::debug("Session state saved (context '{}')", state.loaded_context);
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), state_path_.string());
    }
}

}  // namespace agentrelay::session
