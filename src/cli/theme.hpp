#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// Monitor palette (ANSI escape sequences)
namespace color {
    const std::string CYAN      = "\033[38;2;64;160;190m";
    const std::string AMBER     = "\033[38;2;214;150;60m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

// Horizontal line `width` columns wide, no surrounding blank lines
inline std::string rule(int width = 40) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";   // U+2500
    return color::DIM + line + color::RESET + "\n";
}

// Clear screen and home the cursor
inline std::string clear_screen() {
    return "\033[2J\033[H";
}

// Title shown above the command prompt
inline std::string banner() {
    return "\n" + color::CYAN + color::BOLD + "  HPS controller monitor"
         + color::RESET + color::DIM + "  v0.1.0" + color::RESET + "\n\n";
}

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::CYAN + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
