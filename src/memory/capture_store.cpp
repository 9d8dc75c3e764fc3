#include "agentrelay/memory/capture_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace agentrelay::memory {

Json CaptureStoreStats::to_json() const {
    return Json{
        {"records", records},
        {"failures", failures},
        {"skipped_on_load", skipped_on_load},
        {"removed_by_retention", removed_by_retention}
    };
}

CaptureStore::CaptureStore(const fs::path& data_dir, size_t max_records, std::chrono::hours max_age)
    : data_dir_(data_dir)
    , path_(data_dir / "captures.jsonl")
    , max_records_(max_records > 0 ? max_records : 1)
    , max_age_(max_age)
{
}

Result<size_t, Error> CaptureStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        fs::create_directories(data_dir_);
    } catch (const fs::filesystem_error& e) {
        return Result<size_t, Error>::err(ErrorCode::StoreLoadFailed, e.what(), data_dir_.string());
    }

    records_.clear();
    skipped_on_load_ = 0;

    if (!fs::exists(path_)) {
        return Result<size_t, Error>::ok(0);
    }

    std::ifstream file(path_);
    if (!file) {
        return Result<size_t, Error>::err(ErrorCode::FileReadFailed, "Failed to open capture store", path_.string());
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            records_.push_back(CaptureRecord::from_json(Json::parse(line)));
        } catch (const Json::exception& e) {
            spdlog::debug("Corrupt capture line: {}", e.what());
            ++skipped_on_load_;
        }
    }

    if (skipped_on_load_ > 0) {
        spdlog::warn("Skipped {} corrupt lines in {}", skipped_on_load_, path_.string());
    }

    return Result<size_t, Error>::ok(records_.size());
}

Result<void, Error> CaptureStore::append(const CaptureRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    {
        std::ofstream file(path_, std::ios::app);
        if (!file) {
            return Result<void, Error>::err(ErrorCode::StoreWriteFailed, "Failed to open capture store", path_.string());
        }
        file << record.to_json().dump() << "\n";
        if (!file) {
            return Result<void, Error>::err(ErrorCode::StoreWriteFailed, "Failed to append capture", path_.string());
        }
    }

    records_.push_back(record);

    auto now = Clock::now();
    if (needs_compaction_locked(now)) {
        auto compacted = compact_locked(now);
        if (compacted.is_err()) {
            return Result<void, Error>::err(std::move(compacted).error());
        }
    }

    return Result<void, Error>::ok();
}

// Rewrites are batched: only once the store is 10% over its count limit or
// the oldest record has aged out
bool CaptureStore::needs_compaction_locked(TimePoint now) const {
    if (records_.empty()) {
        return false;
    }
    if (records_.size() > max_records_ + max_records_ / 10) {
        return true;
    }
    return now - records_.front().ended_at > max_age_;
}

// Records are only dropped from memory once the rewritten file is in place
Result<size_t, Error> CaptureStore::compact_locked(TimePoint now) {
    size_t removed = 0;
    while (removed < records_.size() && now - records_[removed].ended_at > max_age_) {
        ++removed;
    }
    if (records_.size() - removed > max_records_) {
        removed = records_.size() - max_records_;
    }

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            return Result<size_t, Error>::err(ErrorCode::StoreWriteFailed, "Failed to rewrite capture store", tmp.string());
        }
        for (size_t i = removed; i < records_.size(); ++i) {
            file << records_[i].to_json().dump() << "\n";
        }
        if (!file) {
            return Result<size_t, Error>::err(ErrorCode::StoreWriteFailed, "Failed to rewrite capture store", tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<size_t, Error>::err(ErrorCode::StoreWriteFailed, "Failed to replace capture store", path_.string());
    }

    records_.erase(records_.begin(), records_.begin() + static_cast<std::ptrdiff_t>(removed));
    removed_by_retention_ += removed;
    if (removed > 0) {
        spdlog::info("Capture store retention removed {} records, {} kept", removed, records_.size());
    }
    return Result<size_t, Error>::ok(removed);
}

Result<size_t, Error> CaptureStore::enforce_retention(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return compact_locked(now);
}

std::vector<CaptureRecord> CaptureStore::recent_failures(Duration window, TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CaptureRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (now - it->ended_at > window) {
            continue;
        }
        if (it->failed()) {
            out.push_back(*it);
        }
    }
    return out;
}

std::vector<CaptureRecord> CaptureStore::recent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CaptureRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < n; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::optional<CaptureRecord> CaptureStore::get(const CaptureId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

size_t CaptureStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

CaptureStoreStats CaptureStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CaptureStoreStats stats;
    stats.records = records_.size();
    for (const auto& record : records_) {
        if (record.failed()) {
            ++stats.failures;
        }
    }
    stats.skipped_on_load = skipped_on_load_;
    stats.removed_by_retention = removed_by_retention_;
    return stats;
}

}  // namespace agentrelay::memory
