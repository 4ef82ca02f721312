#include "terminal_output.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace TerminalOutput {

// ── Internal helpers ────────────────────────────────────────────

static const char* const kDestructive[] = {
    "\033[?1049h",  // Alt screen enter
    "\033[?1049l",  // Alt screen exit
    "\033[?47h",
    "\033[?47l",
    "\033[2J",      // Clear screen
    "\033[3J",      // Clear scrollback
    "\033[H",       // Cursor home
    "\033c",        // Full reset
};

// Remove all occurrences of escape sequence `seq`
static void strip_seq(std::string& s, const char* seq) {
    size_t len = std::strlen(seq);
    std::string::size_type pos;
    while ((pos = s.find(seq)) != std::string::npos)
        s.erase(pos, len);
}

// True if `tail` is a proper prefix of some destructive sequence
static bool is_partial_destructive(const std::string& tail) {
    for (const char* seq : kDestructive) {
        size_t len = std::strlen(seq);
        if (tail.size() < len && std::strncmp(seq, tail.data(), tail.size()) == 0)
            return true;
    }
    return false;
}

// ── Public API ──────────────────────────────────────────────────

std::string filter_for_display(const std::string& text) {
    if (text.find('\033') == std::string::npos) return text;

    std::string display = text;
    for (const char* seq : kDestructive)
        strip_seq(display, seq);
    return display;
}

std::string DisplayFilter::feed(const std::string& chunk) {
    std::string text = pending_ + chunk;
    pending_.clear();

    auto esc = text.rfind('\033');
    if (esc != std::string::npos && is_partial_destructive(text.substr(esc))) {
        pending_ = text.substr(esc);
        text.erase(esc);
    }
    return filter_for_display(text);
}

std::string DisplayFilter::flush() {
    std::string rest;
    rest.swap(pending_);
    return rest;
}

void write_stdout(const std::string& text) {
    const char* p = text.data();
    size_t left = text.size();
    while (left > 0) {
        ssize_t n = write(STDOUT_FILENO, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // namespace TerminalOutput
