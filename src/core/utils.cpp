#include "utils.hpp"
#include "types.hpp"
#include "cancel_token.hpp"
#include <platform/platform.hpp>
#include <filesystem>

namespace fs = std::filesystem;

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir().string();
    if (path[1] != '/') return path;   // ~user is not supported
    return (platform::home_dir() / path.substr(2)).string();
}

bool path_is_under(const std::string& path, const std::string& dir) {
    fs::path p = fs::path(path).lexically_normal();
    fs::path d = fs::path(dir).lexically_normal();
    if (!d.has_filename() && d.has_parent_path()) d = d.parent_path();  // "logs/" -> "logs"
    auto rel = p.lexically_relative(d);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return *first != ".." && *first != ".";
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:           return "None";
        case ErrorCode::EmptyCommand:   return "EmptyCommand";
        case ErrorCode::InvalidCommand: return "InvalidCommand";
        case ErrorCode::ChannelTimeout: return "ChannelTimeout";
        case ErrorCode::LogNotFound:    return "LogNotFound";
        case ErrorCode::LogLost:        return "LogLost";
        case ErrorCode::TerminalMode:   return "TerminalMode";
        case ErrorCode::Config:         return "Config";
        case ErrorCode::Io:             return "Io";
    }
    return "Unknown";
}

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::None:        return "None";
        case StopReason::DismissKey:  return "DismissKey";
        case StopReason::Interrupted: return "Interrupted";
        case StopReason::InputClosed: return "InputClosed";
        case StopReason::LogLost:     return "LogLost";
        case StopReason::Shutdown:    return "Shutdown";
    }
    return "Unknown";
}
