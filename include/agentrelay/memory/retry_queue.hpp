#pragma once

#include "agentrelay/core/result.hpp"
#include "capture_record.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace agentrelay::memory {

using namespace agentrelay::core;
namespace fs = std::filesystem;

// A capture waiting to be forwarded to the memory store
struct RetryEntry {
    CaptureRecord record;
    int attempts = 0;  // failed forward attempts so far, never decreases
    TimePoint enqueued_at;
    TimePoint next_retry_at;
    std::string last_error;

    Json to_json() const;
    static RetryEntry from_json(const Json& j);
};

struct RetryStats {
    size_t pending = 0;
    uint64_t forwarded = 0;
    uint64_t dropped = 0;

    Json to_json() const;
};

// Persistent (retry_queue.json) queue of captures the memory store has not
// accepted yet. Entries are dropped with a warning at max_attempts.
class RetryQueue {
public:
    RetryQueue(const fs::path& data_dir, int max_attempts, size_t max_entries, Duration base_interval);

    Result<size_t, Error> load();
    Result<void, Error> save() const;

    // Add a capture after `attempts` failed forwards (0 when never tried).
    // Returns false when it was dropped instead.
    bool enqueue(const CaptureRecord& record, TimePoint now, int attempts, const std::string& error);

    // Entries eligible for another attempt, oldest first
    std::vector<RetryEntry> due(TimePoint now) const;

    void record_success(const CaptureId& id);

    // Count a failed attempt and back off; returns true if the entry was dropped
    bool record_failure(const CaptureId& id, TimePoint now, const std::string& error);

    std::optional<RetryEntry> get(const CaptureId& id) const;
    size_t size() const;
    RetryStats stats() const;

    int max_attempts() const { return max_attempts_; }

private:
    fs::path path_;
    int max_attempts_;
    size_t max_entries_;
    Duration base_interval_;

    mutable std::mutex mutex_;
    std::vector<RetryEntry> entries_;
    uint64_t forwarded_ = 0;
    uint64_t dropped_ = 0;

    Duration backoff(int attempts) const;
    Result<void, Error> save_locked() const;
    void persist_locked() const;
};

}  // namespace agentrelay::memory
