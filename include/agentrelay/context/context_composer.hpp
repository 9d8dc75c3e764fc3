#pragma once

#include "agentrelay/core/config.hpp"
#include "agentrelay/core/result.hpp"
#include "recent_buffer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentrelay::context {

using namespace agentrelay::core;
namespace fs = std::filesystem;

// Builds the labeled prompt sections in a fixed order; empty sections are left out
class PromptBuilder {
public:
    PromptBuilder& with_header(const std::string& header, const std::string& destination = "");
    PromptBuilder& with_time(TimePoint now);
    PromptBuilder& with_memory_context(const std::string& memory);
    PromptBuilder& with_recent(const std::vector<Exchange>& recent);
    PromptBuilder& with_message(const std::string& message);

    std::string build() const;

private:
    std::string header_;
    std::string time_;
    std::string memory_;
    std::string recent_;
    std::string message_;
};

// What actually gets typed into the session
struct Submission {
    std::string text;
    std::optional<std::string> sentinel;
    std::optional<fs::path> artifact;  // set when the prompt went to a side file
    size_t composed_size = 0;
    bool inline_fallback = false;      // over the threshold but the side file could not be written
};

class ContextComposer {
public:
    explicit ContextComposer(const ComposerConfig& config);

    // Full prompt text: header, time, memory context, recent exchanges, request
    std::string build(const std::string& memory_context,
                      const std::vector<Exchange>& recent,
                      const std::string& request,
                      const std::string& destination = "") const;

    // Prompt ready to submit. Above the inline threshold the prompt is written
    // to <artifact_dir>/context_<id>.md and a pointer instruction is returned;
    // if that file cannot be written the full prompt goes inline instead.
    Result<Submission, Error> compose(const std::string& memory_context,
                                      const std::vector<Exchange>& recent,
                                      const std::string& request,
                                      const std::optional<std::string>& sentinel = std::nullopt,
                                      const std::string& destination = "");

    // Remove the oldest artifacts beyond the retention count
    Result<size_t, Error> prune_artifacts() const;

    static std::string pointer_instruction(const fs::path& artifact);
    static std::string append_sentinel(const std::string& text, const std::string& sentinel);

private:
    ComposerConfig config_;

    Result<void, Error> write_artifact(const fs::path& artifact, const std::string& composed) const;
};

}  // namespace agentrelay::context
