#pragma once

#include "pattern_library.hpp"

#include <string>
#include <vector>

namespace agentrelay::response {

struct SanitizeResult {
    std::string text;
    bool leak_detected = false;
    bool empty = false;                      // nothing user-facing survived
    std::vector<std::string> rules_applied;  // rules that removed something, first-hit order
};

// Two-tier cleaner. The light pass always runs; the aggressive pass only
// runs when leak detection fires, and removes the offending lines.
class Sanitizer {
public:
    explicit Sanitizer(const PatternLibrary& patterns);

    // raw = true skips chrome and leak handling and fences the text
    SanitizeResult sanitize(const std::string& candidate, bool raw = false) const;

private:
    const PatternLibrary& patterns_;

    static void note(std::vector<std::string>& applied, const std::string& name);
    static std::vector<std::string> collapse_blank_runs(const std::vector<std::string>& lines);
};

}  // namespace agentrelay::response
