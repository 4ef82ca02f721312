#include "key_listener.hpp"
#include "monitor_log.hpp"
#include <core/constants.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <functional>
#include <unistd.h>

KeyListener::KeyListener(int fd, char dismiss_key, int poll_ms)
    : fd_(fd), dismiss_key_(dismiss_key), poll_ms_(poll_ms) {}

KeyListener::~KeyListener() {
    join();
}

void KeyListener::start(CancelToken& token) {
    thread_ = std::thread(&KeyListener::run, this, std::ref(token));
}

void KeyListener::join() {
    if (thread_.joinable()) thread_.join();
}

StopReason KeyListener::classify(char c) const {
    if (c == dismiss_key_) return StopReason::DismissKey;
    // ISIG is off in no-echo mode, so Ctrl-C arrives as a byte
    if (c == CTRL_C) return StopReason::Interrupted;
    return StopReason::None;
}

void KeyListener::run(CancelToken& token) {
    char buf[64];

    while (!token.requested()) {
        if (platform::interrupted()) {
            token.request(StopReason::Interrupted);
            break;
        }

        if (!platform::poll_readable(fd_, poll_ms_)) continue;

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            hps_log(fmt::format("KeyListener: read failed: {}", std::strerror(errno)));
            token.request(StopReason::InputClosed);
            break;
        }
        if (n == 0) {
            token.request(StopReason::InputClosed);
            break;
        }

        for (ssize_t i = 0; i < n; i++) {
            StopReason r = classify(buf[i]);
            if (r != StopReason::None) {
                token.request(r);
                break;
            }
            ignored_.fetch_add(1);
        }
    }
    hps_log(fmt::format("KeyListener: stopped ({})", stop_reason_name(token.reason())));
}
