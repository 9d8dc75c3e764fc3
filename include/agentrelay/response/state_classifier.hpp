#pragma once

#include "agentrelay/core/types.hpp"
#include "pattern_library.hpp"

#include <string>
#include <vector>

namespace agentrelay::response {

using namespace agentrelay::core;

struct Classification {
    ScreenState state = ScreenState::Unknown;
    std::string rule;  // name of the deciding rule, empty for Unknown
};

// Maps a screen capture to a ScreenState using the pattern table.
// Only the last `tail_lines` non-blank lines are considered. Permission and
// error markers count only in lines the session drew during the current turn;
// a menu line (PermissionOption) needs a second one beside it.
class StateClassifier {
public:
    explicit StateClassifier(const PatternLibrary& patterns, int tail_lines = 12);

    ScreenState classify(const std::string& capture) const;
    Classification explain(const std::string& capture) const;

private:
    const PatternLibrary& patterns_;
    int tail_lines_;

    // Bodies of the current turn's lines outside answer blocks
    std::vector<std::string> session_lines(const std::vector<std::string>& raw,
                                           const std::vector<std::string>& bodies) const;
};

}  // namespace agentrelay::response
