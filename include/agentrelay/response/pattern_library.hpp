#pragma once

#include "agentrelay/core/result.hpp"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace agentrelay::response {

using namespace agentrelay::core;
namespace fs = std::filesystem;

// What a terminal line is
enum class PatternCategory {
    UiChrome,          // banners, borders, hints, cost/telemetry
    ToolEcho,          // tool invocation lines and their indented output
    Working,           // spinners, "esc to interrupt", elapsed time with tokens
    PermissionPrompt,  // confirmation prompts with yes/no affordances
    PermissionOption,  // menu lines of a confirmation dialog; need a companion line
    ErrorMarker,       // API errors, crashes
    IdlePrompt,        // input prompt glyph with nothing after it
    PromptInput,       // input prompt glyph followed by typed text
    LinePrefix,        // bullet markers stripped before matching
    InstructionEcho,   // leaked relay instructions
    StructuredData,    // leaked JSON / API fragments
    InternalPath,      // leaked internal filesystem paths
};

std::string_view category_to_string(PatternCategory category);
std::optional<PatternCategory> category_from_string(std::string_view str);

struct PatternRule {
    std::string name;
    PatternCategory category;
    std::string pattern;
    bool icase = false;
    std::regex regex;
};

// Ordered, data-driven table of line patterns. Lookups walk the rules in
// table order, so earlier rules win.
class PatternLibrary {
public:
    PatternLibrary() = default;

    // Default table shipped with the relay
    static PatternLibrary builtin();

    // YAML table: {version: str, rules: [{name, category, pattern, icase}]}
    static Result<PatternLibrary, Error> load(const fs::path& path);
    static Result<PatternLibrary, Error> from_yaml(const std::string& yaml);

    Result<void, Error> add_rule(std::string name, PatternCategory category,
                                 std::string pattern, bool icase = false);

    bool matches(const std::string& text, PatternCategory category) const;

    // First rule (in table order) of any of the categories that matches
    const PatternRule* first_match(const std::string& text,
                                   std::initializer_list<PatternCategory> categories) const;

    // Remove leading bullet markers; indentation before them is kept
    std::string strip_prefix(const std::string& line) const;

    // Line as the rules see it: prefix stripped and trimmed
    std::string body(const std::string& line) const;

    const std::string& version() const { return version_; }
    void set_version(std::string version) { version_ = std::move(version); }

    size_t size() const { return rules_.size(); }
    const std::vector<PatternRule>& rules() const { return rules_; }

private:
    std::string version_ = "empty";
    std::vector<PatternRule> rules_;
};

}  // namespace agentrelay::response
