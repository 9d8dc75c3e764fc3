#include "agentrelay/context/recent_buffer.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>

namespace agentrelay::context {

RecentBuffer::RecentBuffer(size_t capacity, size_t entry_max_chars)
    : capacity_(capacity)
    , entry_max_chars_(entry_max_chars)
{
}

std::string RecentBuffer::truncate(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    size_t cut = max_chars;
    // Back up over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "…";
}

std::string RecentBuffer::format(const std::vector<Exchange>& exchanges) {
    std::ostringstream ss;
    for (size_t i = 0; i < exchanges.size(); ++i) {
        if (i > 0) {
            ss << "\n";
        }
        ss << "**User:** " << exchanges[i].user << "\n";
        if (!exchanges[i].assistant.empty()) {
            ss << "**Assistant:** " << exchanges[i].assistant << "\n";
        }
    }
    return ss.str();
}

void RecentBuffer::append(const ContextId& context, Exchange exchange) {
    if (capacity_ == 0) {
        return;
    }

    exchange.user = truncate(exchange.user, entry_max_chars_);
    exchange.assistant = truncate(exchange.assistant, entry_max_chars_);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& buffer = buffers_[context];
    buffer.push_back(std::move(exchange));
    while (buffer.size() > capacity_) {
        buffer.pop_front();
    }
}

std::vector<Exchange> RecentBuffer::get_recent(const ContextId& context, size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(context);
    if (it == buffers_.end()) {
        return {};
    }
    const auto& buffer = it->second;
    size_t start = buffer.size() > n ? buffer.size() - n : 0;
    return std::vector<Exchange>(buffer.begin() + static_cast<std::ptrdiff_t>(start), buffer.end());
}

std::vector<Exchange> RecentBuffer::entries(const ContextId& context) const {
    return get_recent(context, capacity_);
}

size_t RecentBuffer::size(const ContextId& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(context);
    return it == buffers_.end() ? 0 : it->second.size();
}

void RecentBuffer::clear(const ContextId& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_.erase(context);
}

}  // namespace agentrelay::context
