#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace agentrelay::core {

// Error codes organized by category
enum class ErrorCode {
    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    Cancelled = 7,
    InternalError = 8,
    InvalidState = 10,

    // Session errors (100-199)
    SessionNotRunning = 100,
    SessionStartFailed = 101,
    CaptureFailed = 102,
    SubmitFailed = 103,
    LockTimeout = 104,
    ContextResetFailed = 105,
    ProcessSpawnFailed = 106,

    // Response errors (200-299)
    PatternInvalid = 201,
    PatternLoadFailed = 202,

    // Memory store errors (300-399)
    StoreLoadFailed = 300,
    StoreWriteFailed = 301,
    StoreCorrupted = 302,
    ForwardFailed = 303,
    CircuitOpen = 304,
    ContextFetchFailed = 305,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,

    // Network errors (800-899)
    ConnectionRefused = 801,
    HttpStatusError = 802,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::SessionNotRunning: return "Interactive session is not running";
        case ErrorCode::SessionStartFailed: return "Failed to start interactive session";
        case ErrorCode::CaptureFailed: return "Failed to capture session screen";
        case ErrorCode::SubmitFailed: return "Failed to submit input to session";
        case ErrorCode::LockTimeout: return "Session lock not acquired in time";
        case ErrorCode::ContextResetFailed: return "Context reset did not complete";
        case ErrorCode::ProcessSpawnFailed: return "Failed to spawn process";

        case ErrorCode::PatternInvalid: return "Invalid pattern";
        case ErrorCode::PatternLoadFailed: return "Failed to load pattern table";

        case ErrorCode::StoreLoadFailed: return "Failed to load capture store";
        case ErrorCode::StoreWriteFailed: return "Failed to write capture store";
        case ErrorCode::StoreCorrupted: return "Capture store data corrupted";
        case ErrorCode::ForwardFailed: return "Failed to forward capture";
        case ErrorCode::CircuitOpen: return "Circuit breaker is open";
        case ErrorCode::ContextFetchFailed: return "Failed to fetch memory context";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";

        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::HttpStatusError: return "Unexpected HTTP status";
    }
    return "Unknown error code";
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::LockTimeout:
        case ErrorCode::CaptureFailed:
        case ErrorCode::ForwardFailed:
        case ErrorCode::CircuitOpen:
        case ErrorCode::ContextFetchFailed:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::HttpStatusError:
            return true;
        default:
            return false;
    }
}

// Check if error is fatal (no recovery possible)
inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
        case ErrorCode::PatternInvalid:
        case ErrorCode::StoreCorrupted:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (file path, session name, etc.)
    std::optional<std::string> source;   // Source location or component

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_code(ErrorCode code) {
        return Error{code};
    }

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_retriable() const { return agentrelay::core::is_retriable(code); }
    bool is_fatal() const { return agentrelay::core::is_fatal(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace agentrelay::core
