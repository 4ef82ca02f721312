#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.hps_cli/monitor.yaml, falling back to built-in defaults when
    // the file does not exist.
    static Result<Config> load();

    // Load an explicit config file. The file must exist.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults rooted at the current home directory.
    static Config defaults();

    // Accessors
    const MonitorSettings& monitor() const { return monitor_; }
    MonitorSettings& monitor() { return monitor_; }
    const std::optional<fs::path>& source() const { return source_; }

public:
    Config() = default;

private:
    MonitorSettings monitor_;
    std::optional<fs::path> source_;
};

// Helper to check if the config exists
bool monitor_config_exists();

// Get paths
fs::path get_monitor_config_path();
fs::path get_default_control_file();
fs::path get_default_logs_dir();

// Create default monitor config
Result<void> create_default_monitor_config();
