#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/core/types.hpp"
#include "agentrelay/memory/circuit_breaker.hpp"
#include "agentrelay/memory/memory_store.hpp"

#include <atomic>

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentrelay::context {

using namespace agentrelay::core;

// TTL cache of memory-context answers keyed by query, evicting least recently stored
class ContextCache {
public:
    ContextCache(Duration ttl, size_t max_entries);

    // Fresh entry only
    std::optional<std::string> get(const std::string& key, SteadyClock::time_point now) const;

    // Any entry, regardless of age
    std::optional<std::string> get_stale(const std::string& key) const;

    void put(const std::string& key, std::string value, SteadyClock::time_point now);

    size_t size() const;
    void clear();

private:
    struct Entry {
        std::string value;
        SteadyClock::time_point stored_at;
        std::list<std::string>::iterator order;
    };

    Duration ttl_;
    size_t max_entries_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> order_;  // front = oldest
};

// Fetches memory context for a request. Never fails: an unreachable store
// yields the last cached answer for the query, or an empty string.
// While the breaker rejects calls the store is not contacted at all.
// Safe to call from several requesters at once.
class MemoryContextProvider {
public:
    MemoryContextProvider(memory::MemoryStore* store,
                          const MemoryStoreConfig& config,
                          const memory::CircuitBreaker* breaker = nullptr);

    std::string fetch(const std::string& query);

    size_t failures() const { return failures_.load(); }
    size_t skipped() const { return skipped_.load(); }
    const ContextCache& cache() const { return cache_; }

private:
    memory::MemoryStore* store_;
    const memory::CircuitBreaker* breaker_;
    bool enabled_;
    ContextCache cache_;
    std::atomic<size_t> failures_{0};
    std::atomic<size_t> skipped_{0};
};

}  // namespace agentrelay::context
