#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

// Failure categories surfaced by the monitor. Each maps to a distinct
// process exit code (see exit_code_for()).
enum class ErrorCode {
    None = 0,
    EmptyCommand,
    InvalidCommand,     // embedded newline would corrupt the mailbox
    ChannelTimeout,
    LogNotFound,
    LogLost,
    TerminalMode,
    Config,
    Io,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::Io};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::Io};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Process exit codes
constexpr int EXIT_OK              = 0;
constexpr int EXIT_GENERIC         = 1;
constexpr int EXIT_EMPTY_COMMAND   = 2;
constexpr int EXIT_CHANNEL_TIMEOUT = 3;
constexpr int EXIT_LOG_NOT_FOUND   = 4;
constexpr int EXIT_TERMINAL_MODE   = 5;
constexpr int EXIT_INVALID_COMMAND = 6;
constexpr int EXIT_CONFIG          = 7;
constexpr int EXIT_INTERRUPTED     = 130;

inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:           return EXIT_OK;
        case ErrorCode::EmptyCommand:   return EXIT_EMPTY_COMMAND;
        case ErrorCode::InvalidCommand: return EXIT_INVALID_COMMAND;
        case ErrorCode::ChannelTimeout: return EXIT_CHANNEL_TIMEOUT;
        case ErrorCode::LogNotFound:    return EXIT_LOG_NOT_FOUND;
        case ErrorCode::TerminalMode:   return EXIT_TERMINAL_MODE;
        case ErrorCode::Config:         return EXIT_CONFIG;
        case ErrorCode::LogLost:
        case ErrorCode::Io:             return EXIT_GENERIC;
    }
    return EXIT_GENERIC;
}

const char* error_code_name(ErrorCode code);

// What the operator does with an empty command line.
enum class EmptyCommandPolicy {
    Reprompt,
    Exit,
};

// What the loop does after a Session aborted on a protocol failure.
enum class ErrorPolicy {
    Loop,
    Exit,
};

// Monitor settings (see ~/.hps_cli/monitor.yaml)
struct MonitorSettings {
    std::string control_file;
    std::string logs_dir;                // read-back must lie under this dir (empty = any path)
    int handoff_timeout_ms = 10000;
    int handoff_poll_ms = 100;
    int log_appear_ms = 1000;            // grace for the log file after its path is advertised
    int follow_poll_ms = 100;
    int key_poll_ms = 50;
    int exec_timeout_ms = 300000;
    char dismiss_key = 'n';
    EmptyCommandPolicy on_empty_command = EmptyCommandPolicy::Reprompt;
    ErrorPolicy on_error = ErrorPolicy::Loop;
    int max_consecutive_failures = 5;    // 0 = unbounded
    bool clear_screen = true;
};

// Receives streamed log text and status lines
using OutputCallback = std::function<void(const std::string&)>;
