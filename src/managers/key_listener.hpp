#pragma once

#include <thread>
#include <atomic>
#include <core/cancel_token.hpp>

// Watches an input descriptor for the dismissal key while a Session is
// following. The descriptor is expected to be in no-echo, non-canonical mode
// so single keystrokes arrive without Enter. Other keys are ignored.
class KeyListener {
public:
    KeyListener(int fd, char dismiss_key, int poll_ms);
    ~KeyListener();

    KeyListener(const KeyListener&) = delete;
    KeyListener& operator=(const KeyListener&) = delete;

    void start(CancelToken& token);
    void join();

    // Classify one input byte. Returns StopReason::None for ignored keys.
    StopReason classify(char c) const;

    int ignored_keys() const { return ignored_.load(); }

private:
    void run(CancelToken& token);

    int fd_;
    char dismiss_key_;
    int poll_ms_;
    std::atomic<int> ignored_{0};
    std::thread thread_;
};
