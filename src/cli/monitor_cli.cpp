#include "monitor_cli.hpp"
#include "loop_policy.hpp"
#include "preflight.hpp"
#include "terminal_output.hpp"
#include "theme.hpp"
#include <managers/log_result.hpp>
#include <managers/monitor_log.hpp>
#include <iostream>
#include <cstdlib>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

MonitorCLI::MonitorCLI(const Config& config)
    : config_(config),
      channel_(config.monitor().control_file, HandoffOptions::from(config.monitor())) {}

SessionIO MonitorCLI::terminal_io() {
    SessionIO io;
    io.input_fd = STDIN_FILENO;
    io.log_out = [this](const std::string& text) {
        TerminalOutput::write_stdout(display_filter_.feed(text));
    };
    io.status_out = [](const std::string& text) {
        std::cout << text << std::flush;
    };
    return io;
}

bool MonitorCLI::preflight(bool interactive) {
    auto issues = run_preflight_checks(config_.monitor(), interactive);
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
        }
        std::cout << theme::step(issue.fix);
    }
    if (!issues.empty()) std::cout << "\n";
    return !has_blocking_issue(issues);
}

void MonitorCLI::reap_stale_state() {
    auto reaped = channel_.reap_stale_log();
    if (reaped) {
        std::cout << theme::info("Removed leftover log " + *reaped);
    }
}

std::optional<std::string> MonitorCLI::prompt() {
    std::cout << theme::step("Enter a command for the controller:") << std::flush;

    std::string prompt = "\001" + theme::color::CYAN + "\002" + "hps"
                       + "\001" + theme::color::RESET + "\002" + "> ";
    char* raw = readline(prompt.c_str());
    if (!raw) {
        return std::nullopt;  // EOF / Ctrl-D
    }

    std::string line = raw;
    free(raw);

    if (!line.empty()) {
        add_history(line.c_str());
    }
    return line;
}

void MonitorCLI::report(const SessionOutcome& outcome) {
    TerminalOutput::write_stdout(display_filter_.flush());
    std::cout << "\n";
    switch (outcome.error) {
        case ErrorCode::None:
            break;
        case ErrorCode::LogLost:
            std::cout << theme::info(outcome.message);
            break;
        default:
            std::cout << theme::fail(outcome.message);
            break;
    }

    if (!outcome.log_path.empty()) {
        if (outcome.log_removed) {
            std::cout << theme::ok("Log removed.");
        } else {
            std::cout << theme::fail("Could not remove " + outcome.log_path);
        }
    }
    std::cout << std::flush;
}

int MonitorCLI::run_loop() {
    if (!preflight(true)) {
        return EXIT_GENERIC;
    }
    reap_stale_state();

    const auto& settings = config_.monitor();
    Monitor monitor(channel_, settings, terminal_io());

    int consecutive_failures = 0;
    bool clear_next = false;

    std::cout << theme::banner();
    while (true) {
        if (clear_next) {
            std::cout << theme::clear_screen() << theme::banner();
        }
        clear_next = false;

        monitor.await_command();
        auto line = prompt();
        if (!line) {
            std::cout << "\n";
            return EXIT_OK;
        }

        SessionOutcome outcome = monitor.submit(*line);
        LoopDecision decision = decide_after_session(outcome, settings, consecutive_failures);

        if (outcome.error == ErrorCode::EmptyCommand) {
            if (decision.action == LoopAction::Exit) {
                std::cout << theme::fail("Empty command. Exiting.");
                return decision.exit_code;
            }
            continue;
        }

        report(outcome);

        if (decision.gave_up) {
            std::cout << theme::fail(fmt::format("{} failures in a row. Giving up.",
                                                 consecutive_failures));
        }
        if (decision.action == LoopAction::Exit) {
            return decision.exit_code;
        }
        clear_next = decision.clear_screen;
    }
}

int MonitorCLI::run_send(const std::string& command) {
    if (!preflight(true)) {
        return EXIT_GENERIC;
    }
    reap_stale_state();

    Monitor monitor(channel_, config_.monitor(), terminal_io());
    SessionOutcome outcome = monitor.submit(command);
    report(outcome);
    return send_exit_code(outcome);
}

int MonitorCLI::run_exec(const std::string& command) {
    if (!preflight(false)) {
        return EXIT_GENERIC;
    }

    const auto& settings = config_.monitor();
    auto sent = channel_.send(command);
    if (sent.is_err()) {
        std::cout << theme::fail(sent.error);
        return exit_code_for(sent.code);
    }
    const std::string& log_path = sent.value;
    hps_log(fmt::format("exec: waiting for result in {}", log_path));

    auto result = wait_for_log_result(log_path, settings.exec_timeout_ms, settings.follow_poll_ms);
    remove_log_file(log_path);

    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return exit_code_for(result.code);
    }

    const LogResult& r = result.value;
    if (!r.message.empty()) {
        std::cout << r.message << "\n";
    }
    if (r.success) {
        std::cout << theme::ok("Command succeeded.");
        return EXIT_OK;
    }
    std::cout << theme::fail("Command failed.");
    return EXIT_GENERIC;
}
