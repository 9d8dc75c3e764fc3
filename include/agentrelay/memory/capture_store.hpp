#pragma once

#include "agentrelay/core/result.hpp"
#include "capture_record.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace agentrelay::memory {

using namespace agentrelay::core;
namespace fs = std::filesystem;

struct CaptureStoreStats {
    size_t records = 0;
    size_t failures = 0;
    size_t skipped_on_load = 0;
    uint64_t removed_by_retention = 0;

    Json to_json() const;
};

// Append-only audit log of turns (captures.jsonl, one record per line),
// bounded by record count and age.
class CaptureStore {
public:
    CaptureStore(const fs::path& data_dir, size_t max_records, std::chrono::hours max_age);

    // Load existing records; returns how many were read
    Result<size_t, Error> open();

    Result<void, Error> append(const CaptureRecord& record);

    // Non-completed turns that ended within `window` of `now`, newest first
    std::vector<CaptureRecord> recent_failures(Duration window, TimePoint now = Clock::now()) const;

    // Last n records, newest first
    std::vector<CaptureRecord> recent(size_t n) const;

    std::optional<CaptureRecord> get(const CaptureId& id) const;

    // Drop records over the count/age limits and rewrite the file; returns how many were dropped
    Result<size_t, Error> enforce_retention(TimePoint now = Clock::now());

    size_t size() const;
    CaptureStoreStats stats() const;
    const fs::path& path() const { return path_; }

private:
    fs::path data_dir_;
    fs::path path_;
    size_t max_records_;
    std::chrono::hours max_age_;

    mutable std::mutex mutex_;
    std::deque<CaptureRecord> records_;
    size_t skipped_on_load_ = 0;
    uint64_t removed_by_retention_ = 0;

    bool needs_compaction_locked(TimePoint now) const;
    Result<size_t, Error> compact_locked(TimePoint now);
};

}  // namespace agentrelay::memory
