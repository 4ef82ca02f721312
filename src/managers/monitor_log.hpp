#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug trace for the monitor: <tmp>/hpsmon_debug.log. Never shown to the
// operator; failures to write are ignored.
inline std::string hps_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

inline void hps_log(const std::string& msg) {
    // Follower and listener threads log concurrently
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ofstream out(hps_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
