#include "agentrelay/response/state_classifier.hpp"
#include "agentrelay/response/terminal_text.hpp"

#include <algorithm>
#include <vector>

namespace agentrelay::response {

StateClassifier::StateClassifier(const PatternLibrary& patterns, int tail_lines)
    : patterns_(patterns)
    , tail_lines_(tail_lines > 0 ? tail_lines : 1)
{
}

ScreenState StateClassifier::classify(const std::string& capture) const {
    return explain(capture).state;
}

std::vector<std::string> StateClassifier::session_lines(const std::vector<std::string>& raw,
                                                        const std::vector<std::string>& bodies) const
{
    auto is_dialog = [this](const std::string& body) {
        return patterns_.matches(body, PatternCategory::PermissionPrompt) ||
               patterns_.matches(body, PatternCategory::PermissionOption);
    };

    // Current turn starts after the last echoed input
    size_t start = 0;
    for (size_t i = 0; i < bodies.size(); ++i) {
        if (patterns_.matches(bodies[i], PatternCategory::PromptInput) && !is_dialog(bodies[i])) {
            start = i + 1;
        }
    }

    // An answer block runs from a bulleted prose line to the next bullet,
    // tool echo, prompt or chrome line
    std::vector<std::string> out;
    bool in_answer = false;
    for (size_t i = start; i < bodies.size(); ++i) {
        const auto& body = bodies[i];
        bool bulleted = trim(raw[i]) != body;
        bool tool = patterns_.matches(body, PatternCategory::ToolEcho);

        if (bulleted && !tool) {
            in_answer = true;
            continue;
        }
        if (bulleted || tool ||
            patterns_.matches(body, PatternCategory::IdlePrompt) ||
            patterns_.matches(body, PatternCategory::PromptInput) ||
            patterns_.matches(body, PatternCategory::UiChrome)) {
            in_answer = false;
        }
        if (!in_answer) {
            out.push_back(body);
        }
    }
    return out;
}

Classification StateClassifier::explain(const std::string& capture) const {
    // Tail window, top to bottom
    std::vector<std::string> raw;
    {
        auto lines = split_lines(strip_control_sequences(capture));
        for (auto it = lines.rbegin(); it != lines.rend() && static_cast<int>(raw.size()) < tail_lines_; ++it) {
            if (!is_blank(*it)) {
                raw.push_back(*it);
            }
        }
        std::reverse(raw.begin(), raw.end());
    }

    if (raw.empty()) {
        return {};
    }

    std::vector<std::string> tail;
    tail.reserve(raw.size());
    for (const auto& line : raw) {
        tail.push_back(patterns_.body(line));
    }

    // Dialogs and errors only count where the session draws them, never
    // inside the agent's own answer
    auto own = session_lines(raw, tail);

    const PatternRule* option_rule = nullptr;
    int options = 0;
    for (const auto& line : own) {
        if (auto rule = patterns_.first_match(line, {PatternCategory::PermissionPrompt})) {
            return {ScreenState::PermissionRequested, rule->name};
        }
        if (auto rule = patterns_.first_match(line, {PatternCategory::PermissionOption})) {
            option_rule = option_rule ? option_rule : rule;
            ++options;
        }
    }
    if (options >= 2) {
        return {ScreenState::PermissionRequested, option_rule->name};
    }

    for (const auto& line : own) {
        if (auto rule = patterns_.first_match(line, {PatternCategory::ErrorMarker})) {
            return {ScreenState::Error, rule->name};
        }
    }

    // Idle: walking up from the bottom past chrome, the first real line is an
    // empty prompt. A progress indicator above that prompt means the prompt is
    // just the always-visible input box of a busy session.
    const PatternRule* idle_rule = nullptr;
    size_t idle_index = 0;
    for (size_t i = tail.size(); i-- > 0;) {
        if (auto rule = patterns_.first_match(tail[i], {PatternCategory::IdlePrompt})) {
            idle_rule = rule;
            idle_index = i;
            break;
        }
        if (!patterns_.matches(tail[i], PatternCategory::UiChrome)) {
            break;
        }
    }

    const PatternRule* working_rule = nullptr;
    for (const auto& line : tail) {
        if (auto rule = patterns_.first_match(line, {PatternCategory::Working})) {
            working_rule = rule;
            break;
        }
    }

    if (idle_rule) {
        bool busy_above = false;
        for (size_t i = 0; i < idle_index; ++i) {
            if (patterns_.matches(tail[i], PatternCategory::Working)) {
                busy_above = true;
                break;
            }
        }
        if (!busy_above) {
            return {ScreenState::Idle, idle_rule->name};
        }
    }

    if (working_rule) {
        return {ScreenState::Working, working_rule->name};
    }

    return {};
}

}  // namespace agentrelay::response
