#include "agentrelay/context/memory_context_provider.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace agentrelay::context {

// ContextCache
ContextCache::ContextCache(Duration ttl, size_t max_entries)
    : ttl_(ttl)
    , max_entries_(max_entries)
{
}

std::optional<std::string> ContextCache::get(const std::string& key, SteadyClock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now - it->second.stored_at > ttl_) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<std::string> ContextCache::get_stale(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

void ContextCache::put(const std::string& key, std::string value, SteadyClock::time_point now) {
    if (max_entries_ == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        order_.erase(it->second.order);
        entries_.erase(it);
    }

    while (entries_.size() >= max_entries_ && !order_.empty()) {
        entries_.erase(order_.front());
        order_.pop_front();
    }

    order_.push_back(key);
    entries_[key] = Entry{std::move(value), now, std::prev(order_.end())};
}

size_t ContextCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ContextCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
}

// MemoryContextProvider
MemoryContextProvider::MemoryContextProvider(memory::MemoryStore* store,
                                             const MemoryStoreConfig& config,
                                             const memory::CircuitBreaker* breaker)
    : store_(store)
    , breaker_(breaker)
    , enabled_(config.enabled)
    , cache_(Duration(config.cache_ttl_ms), static_cast<size_t>(std::max(0, config.cache_max_entries)))
{
}

std::string MemoryContextProvider::fetch(const std::string& query) {
    if (!enabled_ || store_ == nullptr) {
        return "";
    }

    auto now = SteadyClock::now();
    if (auto cached = cache_.get(query, now)) {
        spdlog::debug("Memory context cache hit ({} bytes)", cached->size());
        return *cached;
    }

    if (breaker_ != nullptr && breaker_->rejecting()) {
        ++skipped_;
        auto stale = cache_.get_stale(query);
        spdlog::debug("Memory store circuit open, {} memory context", stale ? "using stale" : "skipping");
        return stale.value_or("");
    }

    auto result = store_->fetch_context(query);
    if (result.is_ok()) {
        std::string context = result.value();
        cache_.put(query, context, now);
        return context;
    }

    ++failures_;
    if (auto stale = cache_.get_stale(query)) {
        spdlog::warn("Memory context fetch failed, using stale entry: {}", result.error().full_message());
        return *stale;
    }

    spdlog::warn("Memory context fetch failed, continuing without: {}", result.error().full_message());
    return "";
}

}  // namespace agentrelay::context
