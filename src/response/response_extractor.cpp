#include "agentrelay/response/response_extractor.hpp"
#include "agentrelay/response/terminal_text.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentrelay::response {

std::string_view strategy_to_string(ExtractionStrategy strategy) {
    switch (strategy) {
        case ExtractionStrategy::Marker: return "marker";
        case ExtractionStrategy::Diff: return "diff";
        case ExtractionStrategy::DiffFallback: return "diff_fallback";
    }
    return "diff";
}

ResponseExtractor::ResponseExtractor(const PatternLibrary& patterns)
    : patterns_(patterns)
{
}

bool ResponseExtractor::is_idle_prompt(const std::string& line) const {
    return patterns_.matches(patterns_.body(line), PatternCategory::IdlePrompt);
}

bool ResponseExtractor::is_prompt_input(const std::string& line) const {
    return patterns_.matches(patterns_.body(line), PatternCategory::PromptInput);
}

// Strip the input box, footer hints and blank lines from the bottom of a screen
void ResponseExtractor::drop_trailing_screen_furniture(std::vector<std::string>& lines) const {
    while (!lines.empty()) {
        const auto& last = lines.back();
        if (is_blank(last) || is_idle_prompt(last) ||
            patterns_.matches(patterns_.body(last), PatternCategory::UiChrome)) {
            lines.pop_back();
            continue;
        }
        break;
    }
}

Extraction ResponseExtractor::extract(const std::string& before,
                                      const std::string& after,
                                      const std::optional<std::string>& sentinel) const
{
    if (sentinel && !sentinel->empty()) {
        if (auto text = extract_after_marker(after, *sentinel)) {
            return {std::move(*text), ExtractionStrategy::Marker};
        }
        spdlog::warn("Sentinel {} not found in capture, falling back to diff extraction", *sentinel);
        return {extract_diff(before, after), ExtractionStrategy::DiffFallback};
    }
    return {extract_diff(before, after), ExtractionStrategy::Diff};
}

std::optional<std::string> ResponseExtractor::extract_after_marker(
    const std::string& after,
    const std::string& sentinel) const
{
    auto lines = split_lines(strip_control_sequences(after));

    size_t marker_line = lines.size();
    size_t marker_pos = std::string::npos;
    for (size_t i = lines.size(); i-- > 0;) {
        auto pos = lines[i].rfind(sentinel);
        if (pos != std::string::npos) {
            marker_line = i;
            marker_pos = pos;
            break;
        }
    }
    if (marker_line == lines.size()) {
        return std::nullopt;
    }

    std::vector<std::string> out;

    // Rest of the marker line, minus the closing bracket of "(ref R-...)"
    std::string rest = lines[marker_line].substr(marker_pos + sentinel.size());
    if (!rest.empty() && rest.front() == ')') {
        rest.erase(0, 1);
    }
    rest = trim(rest);
    if (!rest.empty() && !patterns_.matches(rest, PatternCategory::UiChrome)) {
        out.push_back(rest);
    }

    for (size_t i = marker_line + 1; i < lines.size(); ++i) {
        if (is_idle_prompt(lines[i])) {
            break;
        }
        out.push_back(rtrim(lines[i]));
    }

    trim_blank_lines(out);
    return join_lines(out);
}

std::string ResponseExtractor::extract_diff(const std::string& before, const std::string& after) const {
    auto before_lines = split_lines(strip_control_sequences(before));
    auto after_lines = split_lines(strip_control_sequences(after));
    for (auto& line : before_lines) line = rtrim(line);
    for (auto& line : after_lines) line = rtrim(line);

    drop_trailing_screen_furniture(before_lines);

    // Largest k where the last k lines of `before` are the first k lines of `after`.
    // Covers both "before is a prefix of after" and a scrolled capture window.
    size_t overlap = 0;
    size_t max_k = std::min(before_lines.size(), after_lines.size());
    for (size_t k = max_k; k > 0; --k) {
        if (std::equal(before_lines.end() - static_cast<std::ptrdiff_t>(k), before_lines.end(),
                       after_lines.begin())) {
            overlap = k;
            break;
        }
    }

    size_t begin = overlap;
    size_t end = after_lines.size();

    // End at the last idle prompt
    for (size_t i = end; i-- > begin;) {
        if (is_idle_prompt(after_lines[i])) {
            end = i;
            break;
        }
    }

    // Start after the echoed input, if it is in the new region
    for (size_t i = begin; i < end; ++i) {
        if (is_prompt_input(after_lines[i])) {
            begin = i + 1;
            break;
        }
    }

    std::vector<std::string> out(after_lines.begin() + static_cast<std::ptrdiff_t>(begin),
                                 after_lines.begin() + static_cast<std::ptrdiff_t>(end));
    trim_blank_lines(out);
    return join_lines(out);
}

}  // namespace agentrelay::response
