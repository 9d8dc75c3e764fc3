#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace agentrelay::core {

namespace fs = std::filesystem;

// Interactive session (tmux) configuration
struct SessionConfig {
    std::string name = "agent-relay";
    std::string start_command = "claude";
    fs::path working_dir = "~";
    std::string tmux_binary = "tmux";
    int capture_lines = 60;
    bool auto_start = true;
    int startup_wait_ms = 3000;
    int command_timeout_ms = 10000;
};

// Completion detection
struct PollerConfig {
    int interval_ms = 500;
    int stability_threshold = 3;  // consecutive identical captures
    int timeout_ms = 60000;
    int interim_delay_ms = 5000;
    int interim_interval_ms = 10000;
    int classify_tail_lines = 12;
};

struct ArbiterConfig {
    int lock_timeout_ms = 2000;
    int max_hold_ms = 600000;
    std::string context_reset_command = "/clear";
    int context_reset_timeout_ms = 8000;
    int empty_response_retries = 1;
    bool use_markers = true;
};

struct ComposerConfig {
    int recent_capacity = 20;
    int recent_entry_max_chars = 500;
    int inline_threshold = 1500;  // bytes
    fs::path artifact_dir = "~/.agentrelay/context";
    int artifact_retention = 50;
    std::string header = "# CHANNEL CONTEXT";
    bool include_time = true;
};

// Local capture store and retry queue
struct CaptureConfig {
    fs::path data_dir = "~/.agentrelay/data";
    int max_records = 5000;
    int max_age_days = 30;
    int retry_max_attempts = 3;
    int retry_queue_max = 100;
    int retry_interval_ms = 60000;
};

struct BreakerConfig {
    int failure_threshold = 5;
    int cooldown_ms = 60000;
    int half_open_trials = 1;
};

// External long-term memory service
struct MemoryStoreConfig {
    bool enabled = true;
    std::string base_url = "http://localhost:37777";
    std::string project = "agentrelay";
    std::string context_path = "/api/context/inject";
    std::string messages_path = "/api/sessions/messages";
    int timeout_ms = 5000;
    int cache_ttl_ms = 300000;
    int cache_max_entries = 100;
};

struct PatternsConfig {
    fs::path file;  // empty = built-in table
};

struct ObservabilityConfig {
    std::string log_level = "info";  // debug, info, warn, error
    fs::path log_path = "~/.agentrelay/logs";
    int max_file_size_mb = 10;
    int max_files = 3;
};

// Main configuration
struct Config {
    SessionConfig session;
    PollerConfig poller;
    ArbiterConfig arbiter;
    ComposerConfig composer;
    CaptureConfig capture;
    BreakerConfig breaker;
    MemoryStoreConfig memory_store;
    PatternsConfig patterns;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    Result<void, Error> save(const fs::path& path) const;

    static fs::path default_path();

    // Expand ~ and environment variables in all path fields
    void expand_paths();

    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace agentrelay::core
