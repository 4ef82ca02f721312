#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs all preflight checks before the first prompt.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const MonitorSettings& settings, bool interactive);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_terminal();
std::vector<PreflightIssue> check_control_channel(const MonitorSettings& settings);
std::vector<PreflightIssue> check_controller_running(const MonitorSettings& settings);

// Only errors (not hints) block the monitor from starting.
bool has_blocking_issue(const std::vector<PreflightIssue>& issues);
