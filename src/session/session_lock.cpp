#include "agentrelay/session/session_lock.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentrelay::session {

// Guard
SessionLock::Guard::Guard(Guard&& other) noexcept
    : lock_(other.lock_)
{
    other.lock_ = nullptr;
}

SessionLock::Guard& SessionLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        lock_ = other.lock_;
        other.lock_ = nullptr;
    }
    return *this;
}

SessionLock::Guard::~Guard() {
    release();
}

void SessionLock::Guard::release() {
    if (lock_) {
        lock_->release_internal();
        lock_ = nullptr;
    }
}

// SessionLock
SessionLock::SessionLock(Duration max_hold)
    : max_hold_(max_hold)
{
}

std::optional<SessionLock::Guard> SessionLock::try_acquire(Duration timeout, const std::string& holder) {
    std::unique_lock<std::mutex> lock(mutex_);

    const uint64_t ticket = next_ticket_++;
    queue_.push_back(ticket);

    auto deadline = SteadyClock::now() + timeout;
    bool acquired = cv_.wait_until(lock, deadline, [this, ticket] {
        return !held_ && queue_.front() == ticket;
    });

    if (!acquired) {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        // The next waiter may now be at the front
        lock.unlock();
        cv_.notify_all();
        if (!holder.empty()) {
            spdlog::debug("Session lock busy, {} gave up after {}ms", holder, timeout.count());
        }
        return std::nullopt;
    }

    queue_.pop_front();
    held_ = true;
    holder_ = holder;
    held_since_ = SteadyClock::now();
    ++acquisitions_;
    return Guard(this);
}

void SessionLock::release_internal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!held_) {
            return;
        }
        auto held = std::chrono::duration_cast<Duration>(SteadyClock::now() - held_since_);
        if (held > max_hold_) {
            spdlog::warn("Session lock held by {} for {}ms (max {}ms)", holder_, held.count(), max_hold_.count());
        }
        held_ = false;
        holder_.clear();
        ++releases_;
    }
    cv_.notify_all();
}

bool SessionLock::is_held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

std::optional<std::string> SessionLock::holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_) {
        return std::nullopt;
    }
    return holder_;
}

bool SessionLock::overdue() const {
    return held_for() > max_hold_;
}

Duration SessionLock::held_for() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_) {
        return Duration{0};
    }
    return std::chrono::duration_cast<Duration>(SteadyClock::now() - held_since_);
}

size_t SessionLock::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t SessionLock::acquisitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquisitions_;
}

uint64_t SessionLock::releases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return releases_;
}

}  // namespace agentrelay::session
