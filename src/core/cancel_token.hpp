#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Why a Session stopped following.
enum class StopReason {
    None = 0,
    DismissKey,     // operator pressed the dismissal key
    Interrupted,    // SIGINT/SIGTERM or Ctrl-C in no-echo mode
    InputClosed,    // stdin reached EOF
    LogLost,        // the log file disappeared
    Shutdown,       // owner tore the Session down
};

const char* stop_reason_name(StopReason reason);

// One-shot cancellation signal shared by the follower, the key listener and
// the foreground loop. The first request wins; later requests are ignored.
class CancelToken {
public:
    void request(StopReason reason) {
        int expected = static_cast<int>(StopReason::None);
        if (reason_.compare_exchange_strong(expected, static_cast<int>(reason))) {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }
    }

    bool requested() const {
        return reason_.load() != static_cast<int>(StopReason::None);
    }

    StopReason reason() const {
        return static_cast<StopReason>(reason_.load());
    }

    // Sleep up to `ms`, waking early on request. Returns requested().
    bool wait_for(int ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return requested(); });
        return requested();
    }

    // Block until a request arrives.
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return requested(); });
    }

private:
    std::atomic<int> reason_{static_cast<int>(StopReason::None)};
    std::mutex mutex_;
    std::condition_variable cv_;
};
