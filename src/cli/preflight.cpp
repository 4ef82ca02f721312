#include "preflight.hpp"
#include <core/utils.hpp>
#include <managers/control_channel.hpp>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <cerrno>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::vector<PreflightIssue> check_terminal() {
    std::vector<PreflightIssue> issues;
    if (!isatty(STDIN_FILENO)) {
        issues.push_back({"Standard input is not a terminal",
                          "Run interactively, or use 'hpsmon exec <command>'"});
    }
    return issues;
}

std::vector<PreflightIssue> check_control_channel(const MonitorSettings& settings) {
    std::vector<PreflightIssue> issues;

    ControlChannel channel(settings.control_file, HandoffOptions::from(settings));
    auto created = channel.ensure_exists();
    if (created.is_err()) {
        issues.push_back({created.error, "Check permissions on " +
                          fs::path(settings.control_file).parent_path().string()});
        return issues;
    }

    if (access(settings.control_file.c_str(), R_OK | W_OK) != 0) {
        issues.push_back({"Control file is not readable and writable: " + settings.control_file,
                          "Fix its permissions or set control_file in monitor.yaml"});
    }

    std::error_code ec;
    if (!settings.logs_dir.empty() && !fs::is_directory(settings.logs_dir, ec)) {
        PreflightIssue hint;
        hint.message = "Logs directory does not exist yet: " + settings.logs_dir;
        hint.fix = "It is created by the HPS client when its controller starts";
        hint.is_hint = true;
        issues.push_back(hint);
    }
    return issues;
}

// The HPS client records its pid next to the control file while its
// controller is watching it.
std::vector<PreflightIssue> check_controller_running(const MonitorSettings& settings) {
    std::vector<PreflightIssue> issues;
    fs::path pid_file = fs::path(settings.control_file).parent_path() / "controller.pid";

    PreflightIssue hint;
    hint.is_hint = true;
    hint.fix = "Start the HPS client so it can answer commands";

    std::ifstream in(pid_file);
    if (!in) {
        hint.message = "No controller pid file at " + pid_file.string();
        issues.push_back(hint);
        return issues;
    }

    std::string text;
    std::getline(in, text);
    trim(text);
    int pid = safe_stoi(text, 0);
    if (pid <= 0 || (kill(pid, 0) != 0 && errno == ESRCH)) {
        hint.message = fmt::format("Controller process '{}' is not running", text);
        issues.push_back(hint);
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const MonitorSettings& settings, bool interactive) {
    std::vector<PreflightIssue> issues;

    if (interactive) {
        auto term = check_terminal();
        issues.insert(issues.end(), term.begin(), term.end());
    }

    auto channel = check_control_channel(settings);
    issues.insert(issues.end(), channel.begin(), channel.end());

    auto controller = check_controller_running(settings);
    issues.insert(issues.end(), controller.begin(), controller.end());

    return issues;
}

bool has_blocking_issue(const std::vector<PreflightIssue>& issues) {
    for (const auto& issue : issues) {
        if (!issue.is_hint) return true;
    }
    return false;
}
