#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Timing and validation knobs for the command handoff.
struct HandoffOptions {
    int timeout_ms = 10000;
    int poll_ms = 100;
    int log_appear_ms = 1000;
    std::string logs_dir;   // empty: accept any advertised path

    static HandoffOptions from(const MonitorSettings& s) {
        return {s.handoff_timeout_ms, s.handoff_poll_ms, s.log_appear_ms, s.logs_dir};
    }
};

// Single-slot mailbox shared with the controller (Dispatcher) process.
//
// The monitor writes a command line into the control file; the controller
// notices the change, starts executing, and overwrites the same file with the
// absolute path of the log it writes to. Nothing but the filesystem is
// shared, so the handoff is detected by polling for the contents to change
// away from the command we just wrote.
class ControlChannel {
public:
    ControlChannel(const std::string& path, HandoffOptions options);

    const std::string& path() const { return path_; }
    const HandoffOptions& options() const { return options_; }

    // Create the control file (and its directory) if missing. Existing
    // contents are left alone.
    Result<void> ensure_exists();

    // Current contents with surrounding whitespace removed ("" if unreadable).
    std::string read() const;

    // Atomically replace the contents.
    Result<void> write(const std::string& content);

    // Hand `command` to the controller and wait for it to advertise a log
    // path. Fails with EmptyCommand, InvalidCommand, ChannelTimeout or
    // LogNotFound.
    Result<std::string> send(const std::string& command);

    // If the control file still names a log under logs_dir (left behind by a
    // monitor that died mid-session), delete that log. Returns its path.
    std::optional<std::string> reap_stale_log();

    // Commands must be non-empty and a single line.
    static Result<void> validate_command(const std::string& command);

private:
    bool accepts_as_log_path(const std::string& content, const std::string& command) const;

    std::string path_;
    HandoffOptions options_;
};
