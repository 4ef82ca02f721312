#pragma once

#include <string>
#include <optional>
#include <core/config.hpp>
#include <managers/control_channel.hpp>
#include "monitor.hpp"
#include "terminal_output.hpp"

class MonitorCLI {
public:
    explicit MonitorCLI(const Config& config);

    // Interactive loop: prompt, send, follow, clean up, prompt again.
    // Returns the process exit code.
    int run_loop();

    // Single Session for `command`, then exit.
    int run_send(const std::string& command);

    // Send `command` and wait for the controller's result without following.
    int run_exec(const std::string& command);

private:
    std::optional<std::string> prompt();
    bool preflight(bool interactive);
    void reap_stale_state();
    void report(const SessionOutcome& outcome);
    SessionIO terminal_io();

    Config config_;
    ControlChannel channel_;
    // Fed by the follower thread; flushed by report() after it has joined
    TerminalOutput::DisplayFilter display_filter_;
};
