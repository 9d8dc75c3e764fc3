#include "agentrelay/memory/retry_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace agentrelay::memory {

namespace {

constexpr int kMaxBackoffShift = 5;

}  // namespace

// RetryEntry
Json RetryEntry::to_json() const {
    return Json{
        {"record", record.to_json()},
        {"attempts", attempts},
        {"enqueued_at", to_millis(enqueued_at)},
        {"next_retry_at", to_millis(next_retry_at)},
        {"last_error", last_error}
    };
}

RetryEntry RetryEntry::from_json(const Json& j) {
    RetryEntry entry;
    if (j.contains("record")) {
        entry.record = CaptureRecord::from_json(j["record"]);
    }
    entry.attempts = j.value("attempts", 0);
    entry.enqueued_at = from_millis(j.value("enqueued_at", int64_t{0}));
    entry.next_retry_at = from_millis(j.value("next_retry_at", int64_t{0}));
    entry.last_error = j.value("last_error", "");
    return entry;
}

Json RetryStats::to_json() const {
    return Json{
        {"pending", pending},
        {"forwarded", forwarded},
        {"dropped", dropped}
    };
}

// RetryQueue
RetryQueue::RetryQueue(const fs::path& data_dir, int max_attempts, size_t max_entries, Duration base_interval)
    : path_(data_dir / "retry_queue.json")
    , max_attempts_(std::max(1, max_attempts))
    , max_entries_(std::max<size_t>(1, max_entries))
    , base_interval_(base_interval)
{
}

Duration RetryQueue::backoff(int attempts) const {
    if (attempts <= 0) {
        return Duration{0};
    }
    int shift = std::min(attempts - 1, kMaxBackoffShift);
    return base_interval_ * (1 << shift);
}

Result<size_t, Error> RetryQueue::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();

    if (!fs::exists(path_)) {
        return Result<size_t, Error>::ok(0);
    }

    std::ifstream file(path_);
    if (!file) {
        return Result<size_t, Error>::err(ErrorCode::FileReadFailed, "Failed to open retry queue", path_.string());
    }

    try {
        Json j = Json::parse(file);
        for (const auto& e : j.value("entries", Json::array())) {
            entries_.push_back(RetryEntry::from_json(e));
        }
        forwarded_ = j.value("forwarded", uint64_t{0});
        dropped_ = j.value("dropped", uint64_t{0});
    } catch (const Json::exception& e) {
        entries_.clear();
        return Result<size_t, Error>::err(ErrorCode::StoreCorrupted, e.what(), path_.string());
    }

    return Result<size_t, Error>::ok(entries_.size());
}

Result<void, Error> RetryQueue::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

Result<void, Error> RetryQueue::save_locked() const {
    try {
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path());
        }

        Json entries = Json::array();
        for (const auto& entry : entries_) {
            entries.push_back(entry.to_json());
        }
        Json j{
            {"entries", entries},
            {"forwarded", forwarded_},
            {"dropped", dropped_}
        };

        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                return Result<void, Error>::err(ErrorCode::FileWriteFailed, "Failed to save retry queue", tmp.string());
            }
            file << j.dump(2);
        }
        fs::rename(tmp, path_);
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), path_.string());
    }
}

void RetryQueue::persist_locked() const {
    auto saved = save_locked();
    if (saved.is_err()) {
        spdlog::error("Failed to persist retry queue: {}", saved.error().full_message());
    }
}

bool RetryQueue::enqueue(const CaptureRecord& record, TimePoint now, int attempts, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (attempts >= max_attempts_) {
        ++dropped_;
        spdlog::warn("Dropping capture {} after {} failed forwards: {}", record.id, attempts, error);
        persist_locked();
        return false;
    }

    auto existing = std::find_if(entries_.begin(), entries_.end(),
                                 [&record](const RetryEntry& e) { return e.record.id == record.id; });
    if (existing != entries_.end()) {
        return true;
    }

    if (entries_.size() >= max_entries_) {
        ++dropped_;
        spdlog::warn("Retry queue full ({}), dropping oldest capture {}", max_entries_, entries_.front().record.id);
        entries_.erase(entries_.begin());
    }

    RetryEntry entry;
    entry.record = record;
    entry.attempts = attempts;
    entry.enqueued_at = now;
    entry.next_retry_at = now + backoff(attempts);
    entry.last_error = error;
    entries_.push_back(std::move(entry));

    persist_locked();
    return true;
}

std::vector<RetryEntry> RetryQueue::due(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RetryEntry> out;
    for (const auto& entry : entries_) {
        if (entry.next_retry_at <= now) {
            out.push_back(entry);
        }
    }
    return out;
}

void RetryQueue::record_success(const CaptureId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const RetryEntry& e) { return e.record.id == id; });
    if (it == entries_.end()) {
        return;
    }
    entries_.erase(it);
    ++forwarded_;
    persist_locked();
}

bool RetryQueue::record_failure(const CaptureId& id, TimePoint now, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const RetryEntry& e) { return e.record.id == id; });
    if (it == entries_.end()) {
        return false;
    }

    ++it->attempts;
    it->last_error = error;

    if (it->attempts >= max_attempts_) {
        spdlog::warn("Dropping capture {} after {} failed forwards: {}", id, it->attempts, error);
        entries_.erase(it);
        ++dropped_;
        persist_locked();
        return true;
    }

    it->next_retry_at = now + backoff(it->attempts);
    persist_locked();
    return false;
}

std::optional<RetryEntry> RetryQueue::get(const CaptureId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.record.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

size_t RetryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

RetryStats RetryQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RetryStats{entries_.size(), forwarded_, dropped_};
}

}  // namespace agentrelay::memory
