#pragma once

#include <string>

namespace platform {

// Get terminal dimensions.
int term_width();

// RAII guard for no-echo key mode: canonical input, echo and signal keys
// off, so single keystrokes (Ctrl-C included) arrive as bytes.
// Destructor restores the saved mode.
struct RawModeGuard {
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    // False if the descriptor is not a terminal or the mode switch failed.
    bool active() const { return impl_ != nullptr; }
    const std::string& error() const { return error_; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
    int fd_;
    std::string error_;
};

// Poll a descriptor for readability with a timeout.
// Returns true if the descriptor has data to read (or hit EOF).
bool poll_readable(int fd, int timeout_ms);

// SIGINT/SIGTERM capture. While installed, the signals set a flag instead of
// killing the process so cleanup code can run.
void install_interrupt_handler();
void remove_interrupt_handler();
bool interrupted();
void clear_interrupted();

} // namespace platform
