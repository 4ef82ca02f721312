#pragma once

#include <atomic>
#include <string>
#include <functional>
#include <unistd.h>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <managers/control_channel.hpp>

// Monitor session states. One command/response/display cycle walks
// Idle -> AwaitingCommand -> SendingCommand -> Following -> Terminating -> Idle.
enum class SessionState {
    Idle,
    AwaitingCommand,
    SendingCommand,
    Following,
    Terminating,
};

const char* session_state_name(SessionState state);

// Where a Session reads keys and writes text.
struct SessionIO {
    int input_fd = STDIN_FILENO;
    OutputCallback log_out;       // streamed log bytes
    OutputCallback status_out;    // operator-facing status lines
    bool capture_signals = true;  // trap SIGINT/SIGTERM while following
};

// Result of one Session.
struct SessionOutcome {
    ErrorCode error = ErrorCode::None;
    std::string message;
    StopReason stop = StopReason::None;
    std::string log_path;
    bool log_removed = false;

    bool ok() const { return error == ErrorCode::None; }
};

// Drives the Session state machine for one command at a time. The prompt
// itself lives in the CLI; this class owns everything from handoff to
// cleanup, and always leaves the terminal restored and the log deleted.
class Monitor {
public:
    using TransitionHook = std::function<void(SessionState from, SessionState to)>;

    Monitor(ControlChannel& channel, const MonitorSettings& settings, SessionIO io);

    SessionState state() const { return state_.load(); }
    void on_transition(TransitionHook hook) { hook_ = std::move(hook); }

    // Idle -> AwaitingCommand. Called before prompting.
    void await_command();

    // Run one Session for `command`. Returns in Idle.
    SessionOutcome submit(const std::string& command);

private:
    void transition(SessionState next);
    void status(const std::string& text);
    SessionOutcome follow(const std::string& log_path);
    void run_following(SessionOutcome& outcome);

    ControlChannel& channel_;
    MonitorSettings settings_;
    SessionIO io_;
    std::atomic<SessionState> state_{SessionState::Idle};
    TransitionHook hook_;
};

// Delete a finished Session's log. A missing file counts as removed.
bool remove_log_file(const std::string& path);
