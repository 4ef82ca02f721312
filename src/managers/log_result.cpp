#include "log_result.hpp"
#include "monitor_log.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

LogResult parse_log_result(const std::string& text) {
    LogResult r;

    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    if (lines.empty()) return r;

    r.status = lines[0];

    // Output may span several lines; the result flag is always last
    bool has_result = lines.size() >= 3 && (lines.back() == "0" || lines.back() == "1");
    size_t msg_end = has_result ? lines.size() - 1 : lines.size();
    for (size_t i = 1; i < msg_end; i++) {
        if (!r.message.empty()) r.message += "\n";
        r.message += lines[i];
    }

    if (r.status == "0") {
        r.complete = true;
        r.success = false;
    } else if (r.status == "1" && has_result) {
        r.complete = true;
        r.success = lines.back() == "1";
    }
    return r;
}

Result<LogResult> wait_for_log_result(const std::string& log_path, int timeout_ms, int poll_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    // The result line is appended after the message is written, so a message
    // whose last line is "0" or "1" briefly looks complete. Only accept a
    // complete parse once a second read returns the same text.
    std::string candidate;
    bool have_candidate = false;

    while (true) {
        std::error_code ec;
        if (!fs::exists(log_path, ec)) {
            return Result<LogResult>::Err(ErrorCode::LogLost, "Log disappeared: " + log_path);
        }

        std::ifstream in(log_path);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        LogResult r = parse_log_result(text);
        if (r.complete && have_candidate && text == candidate) {
            hps_log(fmt::format("wait_for_log_result: {} complete, success={}", log_path, r.success));
            return Result<LogResult>::Ok(r);
        }
        have_candidate = r.complete;
        candidate = r.complete ? text : std::string();

        if (clock::now() >= deadline) {
            return Result<LogResult>::Err(ErrorCode::ChannelTimeout,
                fmt::format("Command did not finish within {} ms.", timeout_ms));
        }
        platform::sleep_ms(poll_ms);
    }
}
