#include "control_channel.hpp"
#include "monitor_log.hpp"
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

ControlChannel::ControlChannel(const std::string& path, HandoffOptions options)
    : path_(path), options_(std::move(options)) {}

Result<void> ControlChannel::ensure_exists() {
    try {
        ensure_parent_directory(path_);
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::Io, e.what());
    }
    std::error_code ec;
    if (fs::exists(path_, ec)) {
        return Result<void>::Ok();
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        return Result<void>::Err(ErrorCode::Io, "Cannot create control file " + path_);
    }
    return Result<void>::Ok();
}

std::string ControlChannel::read() const {
    std::ifstream in(path_);
    if (!in) return "";
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    trim(content);
    return content;
}

Result<void> ControlChannel::write(const std::string& content) {
    try {
        ensure_parent_directory(path_);
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::Io, e.what());
    }

    std::string error;
    if (!platform::atomic_write_file(path_, content, &error)) {
        return Result<void>::Err(ErrorCode::Io, "Write control file failed: " + error);
    }
    return Result<void>::Ok();
}

Result<void> ControlChannel::validate_command(const std::string& command) {
    std::string trimmed = command;
    trim(trimmed);
    if (trimmed.empty()) {
        return Result<void>::Err(ErrorCode::EmptyCommand, "Empty command.");
    }
    if (trimmed.find_first_of("\r\n") != std::string::npos) {
        return Result<void>::Err(ErrorCode::InvalidCommand,
            "Command must be a single line.");
    }
    return Result<void>::Ok();
}

bool ControlChannel::accepts_as_log_path(const std::string& content,
                                         const std::string& command) const {
    if (content.empty() || content == command) return false;
    if (!options_.logs_dir.empty() && !path_is_under(content, options_.logs_dir)) return false;
    return true;
}

Result<std::string> ControlChannel::send(const std::string& command) {
    auto valid = validate_command(command);
    if (valid.is_err()) {
        return Result<std::string>::Err(valid.code, valid.error);
    }

    std::string cmd = command;
    trim(cmd);

    auto written = write(cmd + "\n");
    if (written.is_err()) {
        return Result<std::string>::Err(written.code, written.error);
    }
    hps_log(fmt::format("ControlChannel: wrote '{}' to {}", cmd, path_));

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(options_.timeout_ms);

    // Wait for the controller to replace our command with a log path
    std::string log_path;
    std::string last_seen;
    while (true) {
        std::string content = read();
        if (accepts_as_log_path(content, cmd)) {
            log_path = content;
            break;
        }
        if (content != last_seen) {
            last_seen = content;
            if (!content.empty() && content != cmd) {
                hps_log(fmt::format("ControlChannel: ignoring '{}' (outside {})",
                                    content, options_.logs_dir));
            }
        }
        if (clock::now() >= deadline) {
            hps_log(fmt::format("ControlChannel: timeout after {}ms, contents='{}'",
                                options_.timeout_ms, content));
            return Result<std::string>::Err(ErrorCode::ChannelTimeout,
                fmt::format("Controller did not answer within {} ms.", options_.timeout_ms));
        }
        platform::sleep_ms(options_.poll_ms);
    }

    hps_log(fmt::format("ControlChannel: controller advertised {}", log_path));

    if (!fs::path(log_path).is_absolute()) {
        return Result<std::string>::Err(ErrorCode::LogNotFound,
            "Log path is not absolute: " + log_path);
    }

    // The controller publishes the path before it creates the file
    auto appear_deadline = clock::now() + std::chrono::milliseconds(options_.log_appear_ms);
    std::error_code ec;
    while (!fs::exists(log_path, ec)) {
        if (clock::now() >= appear_deadline) {
            hps_log(fmt::format("ControlChannel: {} never appeared", log_path));
            return Result<std::string>::Err(ErrorCode::LogNotFound,
                "Log not found: " + log_path);
        }
        platform::sleep_ms(std::min(options_.poll_ms, 50));
    }

    return Result<std::string>::Ok(log_path);
}

std::optional<std::string> ControlChannel::reap_stale_log() {
    if (options_.logs_dir.empty()) return std::nullopt;

    std::string content = read();
    if (content.empty() || !path_is_under(content, options_.logs_dir)) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::is_regular_file(content, ec)) return std::nullopt;
    if (!fs::remove(content, ec) || ec) {
        hps_log(fmt::format("ControlChannel: could not reap {}: {}", content, ec.message()));
        return std::nullopt;
    }
    hps_log(fmt::format("ControlChannel: reaped stale log {}", content));
    return content;
}
