#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/core/result.hpp"
#include "capture_record.hpp"

#include <string>

namespace agentrelay::memory {

using namespace agentrelay::core;

// External long-term memory service
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    // Context relevant to `query`; may be empty
    virtual Result<std::string, Error> fetch_context(const std::string& query) = 0;

    // Record a finished exchange
    virtual Result<void, Error> forward(const CaptureRecord& record) = 0;
};

// MemoryStore over HTTP
class HttpMemoryStore : public MemoryStore {
public:
    explicit HttpMemoryStore(const MemoryStoreConfig& config);

    Result<std::string, Error> fetch_context(const std::string& query) override;
    Result<void, Error> forward(const CaptureRecord& record) override;

    // Body sent for a record
    Json build_message(const CaptureRecord& record) const;

private:
    MemoryStoreConfig config_;
};

}  // namespace agentrelay::memory
