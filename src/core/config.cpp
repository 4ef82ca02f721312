#include "config.hpp"
#include "constants.hpp"
#include "directory_structure.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

bool monitor_config_exists() {
    return fs::exists(get_monitor_config_path());
}

fs::path get_monitor_config_path() {
    return get_hps_root() / MONITOR_CONFIG_NAME;
}

fs::path get_default_control_file() {
    return get_hps_root() / CONTROL_FILE_NAME;
}

fs::path get_default_logs_dir() {
    return get_hps_root() / LOGS_DIR_NAME;
}

Result<void> create_default_monitor_config() {
    fs::path config_path = get_monitor_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    try {
        ensure_hps_directory_structure();
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::Config, e.what());
    }

    const char* default_config = R"(# HPS controller monitor configuration
# Every key is optional; the values below are the defaults.

# Mailbox shared with the HPS client's controller
control_file: "~/.hps_cli/controller_hpscli"

# Log paths advertised by the controller must live here ("" accepts any path)
logs_dir: "~/.hps_cli/logs"

# Handoff: how long to wait for the controller to answer, and how often to look
handoff_timeout_ms: 10000
handoff_poll_ms: 100
log_appear_ms: 1000

# Following
follow_poll_ms: 100
key_poll_ms: 50
dismiss_key: "n"

# Non-interactive `hpsmon exec`
exec_timeout_ms: 300000

# Loop behaviour: reprompt | exit, loop | exit
on_empty_command: "reprompt"
on_error: "loop"
max_consecutive_failures: 5
clear_screen: true
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorCode::Config,
                "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::Config,
            "Failed to write config file: " + std::string(e.what()));
    }
}

// Reads a positive millisecond value; rejects zero and negatives.
static int parse_ms(const YAML::Node& node, const char* key, int fallback) {
    if (!node[key]) return fallback;
    int v = node[key].as<int>();
    if (v <= 0) {
        throw std::runtime_error(std::string(key) + " must be positive");
    }
    return v;
}

static MonitorSettings parse_monitor_settings(const YAML::Node& node) {
    MonitorSettings s = Config::defaults().monitor();

    if (node["control_file"]) {
        s.control_file = expand_home(node["control_file"].as<std::string>());
        if (s.control_file.empty()) {
            throw std::runtime_error("control_file must not be empty");
        }
    }
    if (node["logs_dir"]) {
        s.logs_dir = expand_home(node["logs_dir"].as<std::string>(""));
    }

    s.handoff_timeout_ms = parse_ms(node, "handoff_timeout_ms", s.handoff_timeout_ms);
    s.handoff_poll_ms = parse_ms(node, "handoff_poll_ms", s.handoff_poll_ms);
    s.follow_poll_ms = parse_ms(node, "follow_poll_ms", s.follow_poll_ms);
    s.key_poll_ms = parse_ms(node, "key_poll_ms", s.key_poll_ms);
    s.exec_timeout_ms = parse_ms(node, "exec_timeout_ms", s.exec_timeout_ms);
    s.log_appear_ms = node["log_appear_ms"].as<int>(s.log_appear_ms);
    if (s.log_appear_ms < 0) s.log_appear_ms = 0;

    if (node["dismiss_key"]) {
        auto key = node["dismiss_key"].as<std::string>();
        if (key.size() != 1 || key[0] == '\n' || key[0] == '\r' || key[0] == CTRL_C) {
            throw std::runtime_error("dismiss_key must be a single printable character");
        }
        s.dismiss_key = key[0];
    }

    if (node["on_empty_command"]) {
        auto v = node["on_empty_command"].as<std::string>();
        if (v == "reprompt") {
            s.on_empty_command = EmptyCommandPolicy::Reprompt;
        } else if (v == "exit") {
            s.on_empty_command = EmptyCommandPolicy::Exit;
        } else {
            throw std::runtime_error("on_empty_command must be 'reprompt' or 'exit', got '" + v + "'");
        }
    }

    if (node["on_error"]) {
        auto v = node["on_error"].as<std::string>();
        if (v == "loop") {
            s.on_error = ErrorPolicy::Loop;
        } else if (v == "exit") {
            s.on_error = ErrorPolicy::Exit;
        } else {
            throw std::runtime_error("on_error must be 'loop' or 'exit', got '" + v + "'");
        }
    }

    s.max_consecutive_failures = node["max_consecutive_failures"].as<int>(s.max_consecutive_failures);
    if (s.max_consecutive_failures < 0) s.max_consecutive_failures = 0;
    s.clear_screen = node["clear_screen"].as<bool>(s.clear_screen);

    return s;
}

Config Config::defaults() {
    Config config;
    config.monitor_.control_file = get_default_control_file().string();
    config.monitor_.logs_dir = get_default_logs_dir().string();
    config.monitor_.handoff_timeout_ms = HANDOFF_TIMEOUT_MS;
    config.monitor_.handoff_poll_ms = HANDOFF_POLL_MS;
    config.monitor_.log_appear_ms = LOG_APPEAR_MS;
    config.monitor_.follow_poll_ms = FOLLOW_POLL_MS;
    config.monitor_.key_poll_ms = KEY_POLL_MS;
    config.monitor_.exec_timeout_ms = EXEC_TIMEOUT_MS;
    config.monitor_.dismiss_key = DEFAULT_DISMISS_KEY;
    config.monitor_.max_consecutive_failures = MAX_CONSECUTIVE_FAILURES;
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(ErrorCode::Config, "Config root must be a mapping");
        }

        Config config;
        config.monitor_ = parse_monitor_settings(root);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::Config,
            std::string("Failed to parse monitor config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorCode::Config, "Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorCode::Config, "Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_ok()) {
        result.value.source_ = path;
    }
    return result;
}

Result<Config> Config::load() {
    if (!monitor_config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_monitor_config_path());
}
