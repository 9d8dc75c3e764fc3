#include "agentrelay/response/pattern_library.hpp"
#include "agentrelay/response/terminal_text.hpp"

#include <yaml-cpp/yaml.h>

namespace agentrelay::response {

namespace {

struct BuiltinRule {
    const char* name;
    PatternCategory category;
    const char* pattern;
    bool icase;
};

using C = PatternCategory;

// std::regex works on bytes: multi-byte glyphs go in (?:a|b) groups, never in [...]
const BuiltinRule kBuiltinRules[] = {
    {"bullet_markers", C::LinePrefix, R"re(^(?:(?:⏺|●)\s*)+)re", false},

    {"bare_prompt", C::IdlePrompt, R"re(^(?:>|❯)\s*$)re", false},
    {"boxed_prompt", C::IdlePrompt, R"re(^│\s*(?:>|❯)\s*(?:│)?\s*$)re", false},

    {"prompt_with_input", C::PromptInput, R"re(^(?:│\s*)?(?:>|❯)\s*(?!│)\S)re", false},

    {"permission_yes_no", C::PermissionPrompt,
     R"re(^(?:│\s*)?(?:allow|approve|press y|do you want to)\b.*(?:y/n|yes/no))re", true},
    {"permission_question", C::PermissionPrompt,
     R"re(^(?:│\s*)?do you want to\b.*\?\s*(?:│\s*)?$)re", true},

    {"permission_accept", C::PermissionOption, R"re(^\s*(?:│\s*)?(?:(?:>|❯)\s*)?1\.\s*yes\b)re", true},
    {"permission_decline", C::PermissionOption, R"re(^\s*(?:│\s*)?(?:(?:>|❯)\s*)?\d\.\s*no\b)re", true},
    {"permission_cancel_hint", C::PermissionOption, R"re(esc(?:ape)? to cancel)re", true},

    {"api_error", C::ErrorMarker, R"re(^(?:⎿\s*)?API Error\b)re", false},
    {"request_failed", C::ErrorMarker,
     R"re(^(?:error|fatal):\s.*(?:overloaded|rate.?limit|credit balance|connection (?:refused|reset|error)|timed? ?out))re",
     true},
    {"session_crash", C::ErrorMarker,
     R"re(^(?:claude code (?:crashed|exited)|request timed out|unhandled (?:error|exception)))re", true},

    {"interrupt_hint", C::Working, R"re(esc to interrupt)re", true},
    {"spinner_verb", C::Working, R"re(^(?:✻|✽|✶|✢|✳|·|\*)\s*[A-Z][a-z]+(?:…|\.\.\.))re", false},
    {"elapsed_tokens", C::Working, R"re(\(\d+s\s*·.*tokens?)re", true},
    {"status_words", C::Working,
     R"re(^(?:thinking|processing|working|compacting conversation)(?:…|\.{0,3})\s*$)re", true},

    {"tool_call", C::ToolEcho,
     R"re(^(?:Read|Write|Edit|MultiEdit|Update|Bash|Search|Fetch|Glob|Grep|LS|WebSearch|WebFetch|TodoRead|TodoWrite|Task|Skill|NotebookEdit|mcp__\S+)\(.*\)?\s*$)re",
     false},
    {"tool_output", C::ToolEcho, R"re(^(?:⎿|⏵))re", false},
    {"tool_tree", C::ToolEcho,
     R"re(^(?:├|└)\s*(?:Read|Write|Edit|Bash|Search|Fetch|Glob|Grep|WebSearch|WebFetch|Task|mcp__\S+))re", false},

    {"box_drawing", C::UiChrome, R"re(^(?:╭|╮|╰|╯|│|─|┌|┐|└|┘|├|┤|┬|┴|┼|━|═))re", false},
    {"spinner_glyph", C::UiChrome,
     R"re(^(?:✻|✽|✶|✢|✳|✓|✗|⏵|▘|▝|⠋|⠙|⠹|⠸|⠼|⠴|⠦|⠧|⠇|⠏)\s*$)re", false},
    {"token_cost", C::UiChrome,
     R"re(^(?:total (?:tokens|cost)|cost:|input tokens|output tokens|cache (?:read|write)|\d+(?:\.\d+)?k?\s*tokens?\s*$))re",
     true},
    {"keyboard_hints", C::UiChrome,
     R"re((?:ctrl[+-]\w|shift[+-]tab|\? for shortcuts|esc(?:ape)? to cancel))re", true},
    {"feedback_prompt", C::UiChrome, R"re(^(?:how is claude doing|\d:\s*(?:bad|fine|good|dismiss)\b))re", true},
    {"hook_messages", C::UiChrome,
     R"re(^(?:(?:ran|read)\s*\d+\s*(?:hooks?|files?|tools?)\b|\d+\s*(?:stop|start)?\s*hooks?\b|hook error))re", true},
    {"version_banner", C::UiChrome, R"re(^(?:claude code v?\d|welcome to claude|/help for help|cwd:\s))re", true},
    {"bypass_permissions", C::UiChrome, R"re(bypass(?:ing)? permissions)re", true},
    {"clear_echo", C::UiChrome, R"re(^(?:(?:>|❯)\s*)?/clear\s*$)re", false},
    {"session_status", C::UiChrome, R"re(^(?:session resumed|continuing conversation|auto-update))re", true},

    {"current_message_ref", C::InstructionEcho, R"re(current message section)re", true},
    {"pointer_instruction", C::InstructionEcho, R"re(^read \S+\.md and respond)re", true},
    {"sentinel_echo", C::InstructionEcho, R"re(\(ref R-[0-9A-F]{8}\))re", false},
    {"section_headers", C::InstructionEcho,
     R"re(^#{1,3}\s*(?:channel context|current time|memory context|recent conversation|current message)\s*$)re", true},
    {"exchange_labels", C::InstructionEcho, R"re(^\*\*(?:User|Assistant):\*\*)re", false},

    {"json_field", C::StructuredData, R"re(^"[A-Za-z_][\w.-]*"\s*:\s*)re", false},
    {"json_open", C::StructuredData, R"re(^(?:\[|\{)\s*")re", false},
    {"json_bracket", C::StructuredData, R"re(^(?:\{|\}|\[|\]),?\s*$)re", false},
    {"curl_command", C::StructuredData, R"re(\bcurl\s+-)re", false},
    {"url_encoded", C::StructuredData, R"re((?:%[0-9A-Fa-f]{2}[^%\s]*){3,})re", false},
    {"local_api", C::StructuredData, R"re(localhost:\d+/api/)re", false},

    {"agent_project_paths", C::InternalPath, R"re(\.claude/projects/)re", false},
    {"relay_dirs", C::InternalPath, R"re((?:~|/home/[^/\s]+|/root)/\.(?:claude|agentrelay)\b)re", false},
    {"jsonl_files", C::InternalPath, R"re([\w.-]+\.jsonl\b)re", false},
    {"context_artifacts", C::InternalPath, R"re(context_ctx_[0-9a-f]{8}\.md)re", false},
};

constexpr const char* kBuiltinVersion = "builtin-4";

}  // namespace

std::string_view category_to_string(PatternCategory category) {
    switch (category) {
        case C::UiChrome: return "ui_chrome";
        case C::ToolEcho: return "tool_echo";
        case C::Working: return "working";
        case C::PermissionPrompt: return "permission_prompt";
        case C::PermissionOption: return "permission_option";
        case C::ErrorMarker: return "error_marker";
        case C::IdlePrompt: return "idle_prompt";
        case C::PromptInput: return "prompt_input";
        case C::LinePrefix: return "line_prefix";
        case C::InstructionEcho: return "instruction_echo";
        case C::StructuredData: return "structured_data";
        case C::InternalPath: return "internal_path";
    }
    return "unknown";
}

std::optional<PatternCategory> category_from_string(std::string_view str) {
    static const PatternCategory all[] = {
        C::UiChrome, C::ToolEcho, C::Working, C::PermissionPrompt, C::PermissionOption, C::ErrorMarker,
        C::IdlePrompt, C::PromptInput, C::LinePrefix, C::InstructionEcho,
        C::StructuredData, C::InternalPath,
    };
    for (auto category : all) {
        if (category_to_string(category) == str) {
            return category;
        }
    }
    return std::nullopt;
}

PatternLibrary PatternLibrary::builtin() {
    PatternLibrary library;
    for (const auto& rule : kBuiltinRules) {
        auto added = library.add_rule(rule.name, rule.category, rule.pattern, rule.icase);
        if (added.is_err()) {
            // The built-in table is fixed; a bad entry is a programming error
            throw std::logic_error("built-in pattern rejected: " + added.error().full_message());
        }
    }
    library.version_ = kBuiltinVersion;
    return library;
}

Result<void, Error> PatternLibrary::add_rule(std::string name, PatternCategory category,
                                             std::string pattern, bool icase) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (icase) {
        flags |= std::regex::icase;
    }

    try {
        std::regex regex(pattern, flags);
        rules_.push_back(PatternRule{
            std::move(name), category, std::move(pattern), icase, std::move(regex)
        });
    } catch (const std::regex_error& e) {
        return Result<void, Error>::err(
            ErrorCode::PatternInvalid,
            std::string("Invalid regex: ") + e.what(),
            name
        );
    }

    return Result<void, Error>::ok();
}

Result<PatternLibrary, Error> PatternLibrary::from_yaml(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        auto rules = root["rules"];
        if (!rules || !rules.IsSequence()) {
            return Result<PatternLibrary, Error>::err(
                ErrorCode::PatternLoadFailed, "Pattern table has no 'rules' sequence");
        }

        PatternLibrary library;
        library.version_ = root["version"].as<std::string>("unversioned");

        for (const auto& node : rules) {
            auto name = node["name"].as<std::string>("");
            auto category_name = node["category"].as<std::string>("");
            auto pattern = node["pattern"].as<std::string>("");

            auto category = category_from_string(category_name);
            if (!category) {
                return Result<PatternLibrary, Error>::err(
                    ErrorCode::PatternInvalid, "Unknown pattern category '" + category_name + "'", name);
            }
            if (name.empty() || pattern.empty()) {
                return Result<PatternLibrary, Error>::err(
                    ErrorCode::PatternInvalid, "Pattern rule needs a name and a pattern", name);
            }

            auto added = library.add_rule(name, *category, pattern, node["icase"].as<bool>(false));
            if (added.is_err()) {
                return Result<PatternLibrary, Error>::err(std::move(added).error());
            }
        }

        return Result<PatternLibrary, Error>::ok(std::move(library));

    } catch (const YAML::Exception& e) {
        return Result<PatternLibrary, Error>::err(
            ErrorCode::PatternLoadFailed, std::string("YAML parse error: ") + e.what());
    }
}

Result<PatternLibrary, Error> PatternLibrary::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<PatternLibrary, Error>::err(
            ErrorCode::FileNotFound, "Pattern table not found", path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return from_yaml(YAML::Dump(root));
    } catch (const YAML::Exception& e) {
        return Result<PatternLibrary, Error>::err(
            ErrorCode::PatternLoadFailed, std::string("YAML parse error: ") + e.what(), path.string());
    }
}

bool PatternLibrary::matches(const std::string& text, PatternCategory category) const {
    for (const auto& rule : rules_) {
        if (rule.category == category && std::regex_search(text, rule.regex)) {
            return true;
        }
    }
    return false;
}

const PatternRule* PatternLibrary::first_match(
    const std::string& text,
    std::initializer_list<PatternCategory> categories) const
{
    for (const auto& rule : rules_) {
        bool wanted = false;
        for (auto category : categories) {
            if (rule.category == category) {
                wanted = true;
                break;
            }
        }
        if (wanted && std::regex_search(text, rule.regex)) {
            return &rule;
        }
    }
    return nullptr;
}

std::string PatternLibrary::strip_prefix(const std::string& line) const {
    size_t indent = 0;
    while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
        ++indent;
    }

    std::string rest = line.substr(indent);
    for (const auto& rule : rules_) {
        if (rule.category != PatternCategory::LinePrefix) {
            continue;
        }
        std::smatch match;
        if (std::regex_search(rest, match, rule.regex, std::regex_constants::match_continuous)) {
            rest = rest.substr(static_cast<size_t>(match.length(0)));
        }
    }
    return line.substr(0, indent) + rest;
}

std::string PatternLibrary::body(const std::string& line) const {
    return trim(strip_prefix(line));
}

}  // namespace agentrelay::response
