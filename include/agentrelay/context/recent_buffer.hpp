#pragma once

#include "agentrelay/core/types.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentrelay::context {

using namespace agentrelay::core;

// One user request and the agent's answer
struct Exchange {
    std::string user;
    std::string assistant;
    RequesterKind requester = RequesterKind::Conversational;
    TimePoint at;
};

// Bounded per-context history of recent exchanges; the oldest entry is
// discarded once a context holds `capacity` of them
class RecentBuffer {
public:
    RecentBuffer(size_t capacity = 20, size_t entry_max_chars = 500);

    void append(const ContextId& context, Exchange exchange);

    // Last n exchanges, oldest first
    std::vector<Exchange> get_recent(const ContextId& context, size_t n) const;
    std::vector<Exchange> entries(const ContextId& context) const;

    size_t size(const ContextId& context) const;
    void clear(const ContextId& context);

    size_t capacity() const { return capacity_; }

    // **User:** / **Assistant:** pairs, one blank line between exchanges
    static std::string format(const std::vector<Exchange>& exchanges);

    // Cut to max_chars bytes on a UTF-8 boundary, marking the cut with an ellipsis
    static std::string truncate(const std::string& text, size_t max_chars);

private:
    size_t capacity_;
    size_t entry_max_chars_;

    mutable std::mutex mutex_;
    std::map<ContextId, std::deque<Exchange>> buffers_;
};

}  // namespace agentrelay::context
