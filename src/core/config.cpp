#include "agentrelay/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace agentrelay::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

namespace {

// Environment overrides win over the file
void apply_env_overrides(Config& config) {
    if (const char* v = std::getenv("AGENTRELAY_SESSION")) {
        config.session.name = v;
    }
    if (const char* v = std::getenv("AGENTRELAY_MEMORY_URL")) {
        config.memory_store.base_url = v;
    }
    if (const char* v = std::getenv("AGENTRELAY_LOG_LEVEL")) {
        config.observability.log_level = v;
    }
}

Result<void, Error> invalid(const std::string& message) {
    return Result<void, Error>::err(ErrorCode::ConfigValidationFailed, message);
}

}  // namespace

fs::path Config::default_path() {
    return expand_path(fs::path("~/.agentrelay/config.yaml"));
}

void Config::expand_paths() {
    session.working_dir = expand_path(session.working_dir);
    composer.artifact_dir = expand_path(composer.artifact_dir);
    capture.data_dir = expand_path(capture.data_dir);
    observability.log_path = expand_path(observability.log_path);
    if (!patterns.file.empty()) {
        patterns.file = expand_path(patterns.file);
    }
}

Result<void, Error> Config::validate() const {
    if (session.name.empty()) {
        return invalid("session.name must not be empty");
    }
    if (session.capture_lines <= 0) {
        return invalid("session.capture_lines must be positive");
    }

    if (poller.interval_ms <= 0) {
        return invalid("poller.interval_ms must be positive");
    }
    if (poller.stability_threshold < 1) {
        return invalid("poller.stability_threshold must be at least 1");
    }
    if (poller.timeout_ms <= poller.interval_ms) {
        return invalid("poller.timeout_ms must be greater than poller.interval_ms");
    }
    if (poller.classify_tail_lines < 1) {
        return invalid("poller.classify_tail_lines must be at least 1");
    }

    if (arbiter.lock_timeout_ms < 0) {
        return invalid("arbiter.lock_timeout_ms must not be negative");
    }
    if (arbiter.max_hold_ms <= 0) {
        return invalid("arbiter.max_hold_ms must be positive");
    }
    if (arbiter.empty_response_retries < 0) {
        return invalid("arbiter.empty_response_retries must not be negative");
    }

    if (composer.recent_capacity < 0) {
        return invalid("composer.recent_capacity must not be negative");
    }
    if (composer.inline_threshold < 64) {
        return invalid("composer.inline_threshold must be at least 64 bytes");
    }

    if (capture.retry_max_attempts < 1) {
        return invalid("capture.retry_max_attempts must be at least 1");
    }
    if (capture.retry_interval_ms <= 0) {
        return invalid("capture.retry_interval_ms must be positive");
    }
    if (capture.max_records <= 0 || capture.retry_queue_max <= 0) {
        return invalid("capture.max_records and capture.retry_queue_max must be positive");
    }

    if (breaker.failure_threshold < 1) {
        return invalid("breaker.failure_threshold must be at least 1");
    }
    if (breaker.cooldown_ms <= 0) {
        return invalid("breaker.cooldown_ms must be positive");
    }
    if (breaker.half_open_trials < 1) {
        return invalid("breaker.half_open_trials must be at least 1");
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto node = root["session"]) {
            config.session.name = node["name"].as<std::string>(config.session.name);
            config.session.start_command = node["start_command"].as<std::string>(config.session.start_command);
            config.session.working_dir = node["working_dir"].as<std::string>(config.session.working_dir.string());
            config.session.tmux_binary = node["tmux_binary"].as<std::string>(config.session.tmux_binary);
            config.session.capture_lines = node["capture_lines"].as<int>(config.session.capture_lines);
            config.session.auto_start = node["auto_start"].as<bool>(config.session.auto_start);
            config.session.startup_wait_ms = node["startup_wait_ms"].as<int>(config.session.startup_wait_ms);
            config.session.command_timeout_ms = node["command_timeout_ms"].as<int>(config.session.command_timeout_ms);
        }

        if (auto node = root["poller"]) {
            config.poller.interval_ms = node["interval_ms"].as<int>(config.poller.interval_ms);
            config.poller.stability_threshold = node["stability_threshold"].as<int>(config.poller.stability_threshold);
            config.poller.timeout_ms = node["timeout_ms"].as<int>(config.poller.timeout_ms);
            config.poller.interim_delay_ms = node["interim_delay_ms"].as<int>(config.poller.interim_delay_ms);
            config.poller.interim_interval_ms = node["interim_interval_ms"].as<int>(config.poller.interim_interval_ms);
            config.poller.classify_tail_lines = node["classify_tail_lines"].as<int>(config.poller.classify_tail_lines);
        }

        if (auto node = root["arbiter"]) {
            config.arbiter.lock_timeout_ms = node["lock_timeout_ms"].as<int>(config.arbiter.lock_timeout_ms);
            config.arbiter.max_hold_ms = node["max_hold_ms"].as<int>(config.arbiter.max_hold_ms);
            config.arbiter.context_reset_command = node["context_reset_command"].as<std::string>(config.arbiter.context_reset_command);
            config.arbiter.context_reset_timeout_ms = node["context_reset_timeout_ms"].as<int>(config.arbiter.context_reset_timeout_ms);
            config.arbiter.empty_response_retries = node["empty_response_retries"].as<int>(config.arbiter.empty_response_retries);
            config.arbiter.use_markers = node["use_markers"].as<bool>(config.arbiter.use_markers);
        }

        if (auto node = root["composer"]) {
            config.composer.recent_capacity = node["recent_capacity"].as<int>(config.composer.recent_capacity);
            config.composer.recent_entry_max_chars = node["recent_entry_max_chars"].as<int>(config.composer.recent_entry_max_chars);
            config.composer.inline_threshold = node["inline_threshold"].as<int>(config.composer.inline_threshold);
            config.composer.artifact_dir = node["artifact_dir"].as<std::string>(config.composer.artifact_dir.string());
            config.composer.artifact_retention = node["artifact_retention"].as<int>(config.composer.artifact_retention);
            config.composer.header = node["header"].as<std::string>(config.composer.header);
            config.composer.include_time = node["include_time"].as<bool>(config.composer.include_time);
        }

        if (auto node = root["capture"]) {
            config.capture.data_dir = node["data_dir"].as<std::string>(config.capture.data_dir.string());
            config.capture.max_records = node["max_records"].as<int>(config.capture.max_records);
            config.capture.max_age_days = node["max_age_days"].as<int>(config.capture.max_age_days);
            config.capture.retry_max_attempts = node["retry_max_attempts"].as<int>(config.capture.retry_max_attempts);
            config.capture.retry_queue_max = node["retry_queue_max"].as<int>(config.capture.retry_queue_max);
            config.capture.retry_interval_ms = node["retry_interval_ms"].as<int>(config.capture.retry_interval_ms);
        }

        if (auto node = root["breaker"]) {
            config.breaker.failure_threshold = node["failure_threshold"].as<int>(config.breaker.failure_threshold);
            config.breaker.cooldown_ms = node["cooldown_ms"].as<int>(config.breaker.cooldown_ms);
            config.breaker.half_open_trials = node["half_open_trials"].as<int>(config.breaker.half_open_trials);
        }

        if (auto node = root["memory_store"]) {
            config.memory_store.enabled = node["enabled"].as<bool>(config.memory_store.enabled);
            config.memory_store.base_url = node["base_url"].as<std::string>(config.memory_store.base_url);
            config.memory_store.project = node["project"].as<std::string>(config.memory_store.project);
            config.memory_store.context_path = node["context_path"].as<std::string>(config.memory_store.context_path);
            config.memory_store.messages_path = node["messages_path"].as<std::string>(config.memory_store.messages_path);
            config.memory_store.timeout_ms = node["timeout_ms"].as<int>(config.memory_store.timeout_ms);
            config.memory_store.cache_ttl_ms = node["cache_ttl_ms"].as<int>(config.memory_store.cache_ttl_ms);
            config.memory_store.cache_max_entries = node["cache_max_entries"].as<int>(config.memory_store.cache_max_entries);
        }

        if (auto node = root["patterns"]) {
            config.patterns.file = node["file"].as<std::string>(config.patterns.file.string());
        }

        if (auto node = root["observability"]) {
            config.observability.log_level = node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = node["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.max_file_size_mb = node["max_file_size_mb"].as<int>(config.observability.max_file_size_mb);
            config.observability.max_files = node["max_files"].as<int>(config.observability.max_files);
        }

        apply_env_overrides(config);
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    apply_env_overrides(config);
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "session" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << session.name;
        out << YAML::Key << "start_command" << YAML::Value << session.start_command;
        out << YAML::Key << "working_dir" << YAML::Value << session.working_dir.string();
        out << YAML::Key << "tmux_binary" << YAML::Value << session.tmux_binary;
        out << YAML::Key << "capture_lines" << YAML::Value << session.capture_lines;
        out << YAML::Key << "auto_start" << YAML::Value << session.auto_start;
        out << YAML::Key << "startup_wait_ms" << YAML::Value << session.startup_wait_ms;
        out << YAML::Key << "command_timeout_ms" << YAML::Value << session.command_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "poller" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "interval_ms" << YAML::Value << poller.interval_ms;
        out << YAML::Key << "stability_threshold" << YAML::Value << poller.stability_threshold;
        out << YAML::Key << "timeout_ms" << YAML::Value << poller.timeout_ms;
        out << YAML::Key << "interim_delay_ms" << YAML::Value << poller.interim_delay_ms;
        out << YAML::Key << "interim_interval_ms" << YAML::Value << poller.interim_interval_ms;
        out << YAML::Key << "classify_tail_lines" << YAML::Value << poller.classify_tail_lines;
        out << YAML::EndMap;

        out << YAML::Key << "arbiter" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "lock_timeout_ms" << YAML::Value << arbiter.lock_timeout_ms;
        out << YAML::Key << "max_hold_ms" << YAML::Value << arbiter.max_hold_ms;
        out << YAML::Key << "context_reset_command" << YAML::Value << arbiter.context_reset_command;
        out << YAML::Key << "context_reset_timeout_ms" << YAML::Value << arbiter.context_reset_timeout_ms;
        out << YAML::Key << "empty_response_retries" << YAML::Value << arbiter.empty_response_retries;
        out << YAML::Key << "use_markers" << YAML::Value << arbiter.use_markers;
        out << YAML::EndMap;

        out << YAML::Key << "composer" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "recent_capacity" << YAML::Value << composer.recent_capacity;
        out << YAML::Key << "recent_entry_max_chars" << YAML::Value << composer.recent_entry_max_chars;
        out << YAML::Key << "inline_threshold" << YAML::Value << composer.inline_threshold;
        out << YAML::Key << "artifact_dir" << YAML::Value << composer.artifact_dir.string();
        out << YAML::Key << "artifact_retention" << YAML::Value << composer.artifact_retention;
        out << YAML::Key << "header" << YAML::Value << composer.header;
        out << YAML::Key << "include_time" << YAML::Value << composer.include_time;
        out << YAML::EndMap;

        out << YAML::Key << "capture" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "data_dir" << YAML::Value << capture.data_dir.string();
        out << YAML::Key << "max_records" << YAML::Value << capture.max_records;
        out << YAML::Key << "max_age_days" << YAML::Value << capture.max_age_days;
        out << YAML::Key << "retry_max_attempts" << YAML::Value << capture.retry_max_attempts;
        out << YAML::Key << "retry_queue_max" << YAML::Value << capture.retry_queue_max;
        out << YAML::Key << "retry_interval_ms" << YAML::Value << capture.retry_interval_ms;
        out << YAML::EndMap;

        out << YAML::Key << "breaker" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "failure_threshold" << YAML::Value << breaker.failure_threshold;
        out << YAML::Key << "cooldown_ms" << YAML::Value << breaker.cooldown_ms;
        out << YAML::Key << "half_open_trials" << YAML::Value << breaker.half_open_trials;
        out << YAML::EndMap;

        out << YAML::Key << "memory_store" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << memory_store.enabled;
        out << YAML::Key << "base_url" << YAML::Value << memory_store.base_url;
        out << YAML::Key << "project" << YAML::Value << memory_store.project;
        out << YAML::Key << "context_path" << YAML::Value << memory_store.context_path;
        out << YAML::Key << "messages_path" << YAML::Value << memory_store.messages_path;
        out << YAML::Key << "timeout_ms" << YAML::Value << memory_store.timeout_ms;
        out << YAML::Key << "cache_ttl_ms" << YAML::Value << memory_store.cache_ttl_ms;
        out << YAML::Key << "cache_max_entries" << YAML::Value << memory_store.cache_max_entries;
        out << YAML::EndMap;

        if (!patterns.file.empty()) {
            out << YAML::Key << "patterns" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "file" << YAML::Value << patterns.file.string();
            out << YAML::EndMap;
        }

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "max_file_size_mb" << YAML::Value << observability.max_file_size_mb;
        out << YAML::Key << "max_files" << YAML::Value << observability.max_files;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace agentrelay::core
