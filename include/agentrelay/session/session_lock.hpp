#pragma once

#include "agentrelay/core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace agentrelay::session {

using namespace agentrelay::core;

// Exclusive access to the interactive session. Waiters are served in arrival
// order; a waiter that times out leaves the queue without ever holding it.
class SessionLock {
public:
    // Releases the lock exactly once, on destruction or release()
    class Guard {
    public:
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        void release();
        bool owns() const { return lock_ != nullptr; }

    private:
        friend class SessionLock;
        explicit Guard(SessionLock* lock) : lock_(lock) {}

        SessionLock* lock_;
    };

    explicit SessionLock(Duration max_hold = std::chrono::minutes(10));

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    std::optional<Guard> try_acquire(Duration timeout, const std::string& holder);

    bool is_held() const;
    std::optional<std::string> holder() const;

    // Held longer than max_hold
    bool overdue() const;
    Duration held_for() const;
    Duration max_hold() const { return max_hold_; }

    size_t waiting() const;
    uint64_t acquisitions() const;
    uint64_t releases() const;

private:
    void release_internal();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<uint64_t> queue_;
    uint64_t next_ticket_ = 0;

    bool held_ = false;
    std::string holder_;
    SteadyClock::time_point held_since_;
    Duration max_hold_;

    uint64_t acquisitions_ = 0;
    uint64_t releases_ = 0;
};

}  // namespace agentrelay::session
