#pragma once

// ── Locations ───────────────────────────────────────────────
// Relative to the home directory unless overridden in monitor.yaml.
constexpr const char* HPS_STATE_DIR        = ".hps_cli";
constexpr const char* CONTROL_FILE_NAME    = "controller_hpscli";
constexpr const char* LOGS_DIR_NAME        = "logs";
constexpr const char* MONITOR_CONFIG_NAME  = "monitor.yaml";
constexpr const char* DEBUG_LOG_NAME       = "hpsmon_debug.log";

// ── Timeouts ────────────────────────────────────────────────
constexpr int HANDOFF_TIMEOUT_MS         = 10000;   // Upper bound waiting for the Dispatcher
constexpr int HANDOFF_POLL_MS            = 100;     // Control file re-read interval
constexpr int LOG_APPEAR_MS              = 1000;    // Log file may lag its advertised path
constexpr int FOLLOW_POLL_MS             = 100;     // Log growth check interval
constexpr int KEY_POLL_MS                = 50;      // Keystroke poll interval
constexpr int EXEC_TIMEOUT_MS            = 300000;  // 5 min for non-interactive exec

// ── Restart loop ────────────────────────────────────────────
constexpr int MAX_CONSECUTIVE_FAILURES   = 5;

// ── Keys ────────────────────────────────────────────────────
constexpr char DEFAULT_DISMISS_KEY       = 'n';
constexpr char CTRL_C                    = 0x03;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int LOG_READ_BUF_SIZE          = 16384;
constexpr int LOG_PREFIX_CHECK_SIZE      = 4096;    // Shown bytes re-read to detect in-place rewrites
