#pragma once

#include "capture_store.hpp"
#include "circuit_breaker.hpp"
#include "memory_store.hpp"
#include "retry_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace agentrelay::memory {

using namespace agentrelay::core;

// Single background worker: records every finished turn in the CaptureStore
// and forwards completed exchanges to the memory store through the breaker,
// queueing whatever could not be delivered. Nothing here blocks a turn.
class CaptureForwarder {
public:
    // `remote` may be null when the memory store is disabled
    CaptureForwarder(CaptureStore& store,
                     RetryQueue& queue,
                     CircuitBreaker& breaker,
                     MemoryStore* remote,
                     Duration retry_interval);
    ~CaptureForwarder();

    CaptureForwarder(const CaptureForwarder&) = delete;
    CaptureForwarder& operator=(const CaptureForwarder&) = delete;

    void start();

    // Processes what is already in the inbox, then joins the worker
    void stop();

    bool running() const { return running_.load(); }

    // Hand off a finished turn; returns immediately
    void submit(CaptureRecord record);

    // Worker steps. Public so they can be driven synchronously.
    size_t process_inbox(TimePoint now = Clock::now());
    size_t drain_due(TimePoint now = Clock::now());

    size_t inbox_size() const;

private:
    CaptureStore& store_;
    RetryQueue& queue_;
    CircuitBreaker& breaker_;
    MemoryStore* remote_;
    Duration retry_interval_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<CaptureRecord> inbox_;

    void run();
    void forward_new(const CaptureRecord& record, TimePoint now);
};

}  // namespace agentrelay::memory
