#include "agentrelay/response/sanitizer.hpp"
#include "agentrelay/response/terminal_text.hpp"

#include <algorithm>

namespace agentrelay::response {

Sanitizer::Sanitizer(const PatternLibrary& patterns)
    : patterns_(patterns)
{
}

void Sanitizer::note(std::vector<std::string>& applied, const std::string& name) {
    if (std::find(applied.begin(), applied.end(), name) == applied.end()) {
        applied.push_back(name);
    }
}

std::vector<std::string> Sanitizer::collapse_blank_runs(const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.empty() && !out.empty() && out.back().empty()) {
            continue;
        }
        out.push_back(line);
    }
    trim_blank_lines(out);
    return out;
}

SanitizeResult Sanitizer::sanitize(const std::string& candidate, bool raw) const {
    SanitizeResult result;

    std::string stripped = strip_control_sequences(candidate);
    if (stripped != candidate) {
        note(result.rules_applied, "control_sequences");
    }

    if (raw) {
        auto lines = split_lines(stripped);
        for (auto& line : lines) line = rtrim(line);
        trim_blank_lines(lines);
        result.empty = lines.empty();
        if (!result.empty) {
            result.text = "```\n" + join_lines(lines) + "\n```";
        }
        return result;
    }

    // Light pass: drop chrome, tool echoes, progress lines and prompts
    std::vector<std::string> kept;
    std::vector<std::string> bodies;
    for (const auto& line : split_lines(stripped)) {
        std::string cleaned = rtrim(patterns_.strip_prefix(line));
        std::string body = trim(cleaned);

        if (body.empty()) {
            kept.emplace_back();
            bodies.emplace_back();
            continue;
        }

        const PatternRule* rule = patterns_.first_match(body, {
            PatternCategory::UiChrome,
            PatternCategory::ToolEcho,
            PatternCategory::Working,
            PatternCategory::IdlePrompt,
            PatternCategory::PermissionPrompt,
        });
        if (rule) {
            note(result.rules_applied, rule->name);
            continue;
        }

        if (cleaned.size() != rtrim(line).size()) {
            note(result.rules_applied, "line_prefix");
        }
        kept.push_back(std::move(cleaned));
        bodies.push_back(std::move(body));
    }

    // Leak detection, then the aggressive pass removes only the offending lines
    std::vector<std::string> final_lines;
    final_lines.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        if (!bodies[i].empty()) {
            const PatternRule* leak = patterns_.first_match(bodies[i], {
                PatternCategory::InstructionEcho,
                PatternCategory::StructuredData,
                PatternCategory::InternalPath,
            });
            if (leak) {
                result.leak_detected = true;
                note(result.rules_applied, "aggressive:" + leak->name);
                continue;
            }
        }
        final_lines.push_back(std::move(kept[i]));
    }

    final_lines = collapse_blank_runs(final_lines);
    result.text = join_lines(final_lines);
    result.empty = result.text.empty();
    return result;
}

}  // namespace agentrelay::response
