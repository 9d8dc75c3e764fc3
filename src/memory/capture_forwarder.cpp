#include "agentrelay/memory/capture_forwarder.hpp"

#include <spdlog/spdlog.h>

namespace agentrelay::memory {

CaptureForwarder::CaptureForwarder(CaptureStore& store,
                                   RetryQueue& queue,
                                   CircuitBreaker& breaker,
                                   MemoryStore* remote,
                                   Duration retry_interval)
    : store_(store)
    , queue_(queue)
    , breaker_(breaker)
    , remote_(remote)
    , retry_interval_(retry_interval)
{
}

CaptureForwarder::~CaptureForwarder() {
    stop();
}

void CaptureForwarder::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this] { run(); });
}

void CaptureForwarder::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    condition_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

void CaptureForwarder::submit(CaptureRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_.push_back(std::move(record));
    }
    condition_.notify_one();
}

size_t CaptureForwarder::inbox_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbox_.size();
}

void CaptureForwarder::run() {
    auto next_drain = SteadyClock::now() + retry_interval_;

    while (true) {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait_until(lock, next_drain, [this] {
                return stop_requested_ || !inbox_.empty();
            });
            stopping = stop_requested_;
        }

        process_inbox();

        if (stopping) {
            return;
        }

        if (SteadyClock::now() >= next_drain) {
            drain_due();
            next_drain = SteadyClock::now() + retry_interval_;
        }
    }
}

size_t CaptureForwarder::process_inbox(TimePoint now) {
    std::deque<CaptureRecord> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(inbox_);
    }

    for (const auto& record : batch) {
        auto stored = store_.append(record);
        if (stored.is_err()) {
            spdlog::error("Failed to store capture {}: {}", record.id, stored.error().full_message());
        }

        if (remote_ && record.final_state == TurnOutcome::Completed) {
            forward_new(record, now);
        }
    }

    return batch.size();
}

void CaptureForwarder::forward_new(const CaptureRecord& record, TimePoint now) {
    if (!breaker_.allow()) {
        queue_.enqueue(record, now, 0, Error{ErrorCode::CircuitOpen}.message);
        return;
    }

    auto forwarded = remote_->forward(record);
    if (forwarded.is_ok()) {
        breaker_.record_success();
        spdlog::debug("Forwarded capture {}", record.id);
        return;
    }

    breaker_.record_failure();
    spdlog::warn("Forward of capture {} failed, queued: {}", record.id, forwarded.error().full_message());
    queue_.enqueue(record, now, 1, forwarded.error().full_message());
}

size_t CaptureForwarder::drain_due(TimePoint now) {
    if (!remote_) {
        return 0;
    }

    size_t delivered = 0;
    for (const auto& entry : queue_.due(now)) {
        // Open breaker: leave the rest for later without spending attempts
        if (!breaker_.allow()) {
            break;
        }

        auto forwarded = remote_->forward(entry.record);
        if (forwarded.is_ok()) {
            breaker_.record_success();
            queue_.record_success(entry.record.id);
            ++delivered;
        } else {
            breaker_.record_failure();
            queue_.record_failure(entry.record.id, now, forwarded.error().full_message());
        }
    }

    if (delivered > 0) {
        spdlog::info("Retry queue delivered {} captures, {} pending", delivered, queue_.size());
    }
    return delivered;
}

}  // namespace agentrelay::memory
