#include "monitor.hpp"
#include "theme.hpp"
#include <managers/log_follower.hpp>
#include <managers/key_listener.hpp>
#include <managers/monitor_log.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:            return "Idle";
        case SessionState::AwaitingCommand: return "AwaitingCommand";
        case SessionState::SendingCommand:  return "SendingCommand";
        case SessionState::Following:       return "Following";
        case SessionState::Terminating:     return "Terminating";
    }
    return "Unknown";
}

bool remove_log_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        hps_log(fmt::format("remove_log_file: {}: {}", path, ec.message()));
        return false;
    }
    return !fs::exists(path, ec);
}

// ── RAII cleanup guard ──────────────────────────────────────────

namespace {

// Runs the Terminating steps on every way out of follow(): stop both
// background tasks, restore the terminal, drop the signal trap, delete the log.
struct FollowCleanup {
    CancelToken* token = nullptr;
    KeyListener* listener = nullptr;
    LogFollower* follower = nullptr;
    std::unique_ptr<platform::RawModeGuard> raw_guard;
    bool has_signal_trap = false;
    std::string log_path;
    bool* log_removed = nullptr;

    ~FollowCleanup() {
        if (token) token->request(StopReason::Shutdown);
        if (listener) listener->join();
        if (follower) follower->join();
        raw_guard.reset();
        if (has_signal_trap)
            platform::remove_interrupt_handler();
        if (!log_path.empty()) {
            bool removed = remove_log_file(log_path);
            if (log_removed) *log_removed = removed;
        }
    }
};

} // namespace

// ── Monitor ─────────────────────────────────────────────────────

Monitor::Monitor(ControlChannel& channel, const MonitorSettings& settings, SessionIO io)
    : channel_(channel), settings_(settings), io_(std::move(io)) {}

void Monitor::transition(SessionState next) {
    SessionState prev = state_.exchange(next);
    hps_log(fmt::format("Monitor: {} -> {}", session_state_name(prev), session_state_name(next)));
    if (hook_) hook_(prev, next);
}

void Monitor::status(const std::string& text) {
    if (io_.status_out) io_.status_out(text);
}

void Monitor::await_command() {
    if (state_.load() == SessionState::Idle) {
        transition(SessionState::AwaitingCommand);
    }
}

SessionOutcome Monitor::submit(const std::string& command) {
    await_command();
    SessionOutcome outcome;

    auto valid = ControlChannel::validate_command(command);
    if (valid.is_err()) {
        outcome.error = valid.code;
        outcome.message = valid.error;
        transition(SessionState::Idle);
        return outcome;
    }

    transition(SessionState::SendingCommand);
    status(theme::step("Sending command to the controller..."));

    auto sent = channel_.send(command);
    if (sent.is_err()) {
        outcome.error = sent.code;
        outcome.message = sent.error;
        hps_log(fmt::format("Monitor: send failed ({}): {}", error_code_name(sent.code), sent.error));
        transition(SessionState::Idle);
        return outcome;
    }

    outcome = follow(sent.value);
    transition(SessionState::Idle);
    return outcome;
}

SessionOutcome Monitor::follow(const std::string& log_path) {
    SessionOutcome outcome;
    outcome.log_path = log_path;
    run_following(outcome);
    return outcome;
}

// Every Terminating step has run by the time this returns.
void Monitor::run_following(SessionOutcome& outcome) {
    const std::string& log_path = outcome.log_path;

    transition(SessionState::Following);

    CancelToken token;
    LogFollower follower(log_path, io_.log_out, settings_.follow_poll_ms);
    KeyListener listener(io_.input_fd, settings_.dismiss_key, settings_.key_poll_ms);

    FollowCleanup cleanup;
    cleanup.log_path = log_path;
    cleanup.log_removed = &outcome.log_removed;

    cleanup.raw_guard = std::make_unique<platform::RawModeGuard>(io_.input_fd);
    if (!cleanup.raw_guard->active()) {
        outcome.error = ErrorCode::TerminalMode;
        outcome.message = "Cannot switch the terminal to raw mode: " + cleanup.raw_guard->error();
        transition(SessionState::Terminating);
        return;
    }

    if (io_.capture_signals) {
        platform::clear_interrupted();
        platform::install_interrupt_handler();
        cleanup.has_signal_trap = true;
    }

    status(theme::kv("log", log_path));
    status(theme::info(fmt::format("Following log in real time (press '{}' to stop)",
                                   settings_.dismiss_key)));
    status(theme::rule(std::min(platform::term_width(), 60)));

    // Full existing contents first; the follower continues from that offset
    auto dumped = follower.dump();
    if (dumped.is_err()) {
        outcome.error = dumped.code;
        outcome.message = dumped.error;
        transition(SessionState::Terminating);
        return;
    }

    cleanup.token = &token;
    cleanup.follower = &follower;
    cleanup.listener = &listener;
    follower.start(token);
    listener.start(token);

    token.wait();
    outcome.stop = token.reason();

    transition(SessionState::Terminating);

    if (outcome.stop == StopReason::LogLost) {
        outcome.error = ErrorCode::LogLost;
        outcome.message = "Log disappeared while following: " + log_path;
    }

    hps_log(fmt::format("Monitor: following ended ({})", stop_reason_name(outcome.stop)));
}
