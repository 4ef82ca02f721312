#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    struct termios old_term;
    if (tcgetattr(fd_, &old_term) != 0) {
        error_ = std::string("tcgetattr: ") + std::strerror(errno);
        return;
    }

    struct termios raw = old_term;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
        error_ = std::string("tcsetattr: ") + std::strerror(errno);
        return;
    }

    impl_ = new Impl{old_term};
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(fd_, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── poll ─────────────────────────────────────────────────────

bool poll_readable(int fd, int timeout_ms) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int rc = poll(&pfd, 1, timeout_ms);
    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

// ── Interrupt capture ────────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_int;
static struct sigaction g_old_term;
static bool g_installed = false;

static void interrupt_handler(int) {
    g_interrupt_flag = 1;
}

void install_interrupt_handler() {
    if (g_installed) return;
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
    g_installed = true;
}

void remove_interrupt_handler() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    g_installed = false;
}

bool interrupted() {
    return g_interrupt_flag != 0;
}

void clear_interrupted() {
    g_interrupt_flag = 0;
}

} // namespace platform
