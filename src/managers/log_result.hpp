#pragma once

#include <string>
#include <core/types.hpp>

// Outcome recorded by the HPS controller in a command log.
//
// The controller rewrites the log as it progresses:
//   line 1: status   ("1" running/succeeded, "0" failed)
//   line 2: message  (command output or error text)
//   line 3: result   ("1" success, "0" failure), only once finished
struct LogResult {
    bool complete = false;
    bool success = false;
    std::string status;
    std::string message;
};

LogResult parse_log_result(const std::string& text);

// Poll `log_path` until the controller records a final result, seen unchanged
// on two consecutive reads, or the timeout expires. Returns ChannelTimeout on expiry, LogLost if the log
// disappears.
Result<LogResult> wait_for_log_result(const std::string& log_path, int timeout_ms, int poll_ms);
