#pragma once

#include "pattern_library.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentrelay::response {

enum class ExtractionStrategy {
    Marker,        // located the sentinel
    Diff,          // no sentinel was embedded
    DiffFallback,  // a sentinel was embedded but is not on screen
};

std::string_view strategy_to_string(ExtractionStrategy strategy);

struct Extraction {
    std::string text;
    ExtractionStrategy strategy = ExtractionStrategy::Diff;
};

// Isolates the text the agent produced for the latest submission
class ResponseExtractor {
public:
    explicit ResponseExtractor(const PatternLibrary& patterns);

    // Marker-based when a sentinel is given and visible, diff-based otherwise
    Extraction extract(const std::string& before,
                       const std::string& after,
                       const std::optional<std::string>& sentinel = std::nullopt) const;

    // Text after the last occurrence of the sentinel, up to the next idle prompt
    std::optional<std::string> extract_after_marker(const std::string& after,
                                                    const std::string& sentinel) const;

    // Lines of `after` that were not already on screen in `before`
    std::string extract_diff(const std::string& before, const std::string& after) const;

private:
    const PatternLibrary& patterns_;

    bool is_idle_prompt(const std::string& line) const;
    bool is_prompt_input(const std::string& line) const;
    void drop_trailing_screen_furniture(std::vector<std::string>& lines) const;
};

}  // namespace agentrelay::response
