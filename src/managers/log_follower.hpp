#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <sys/types.h>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// Follows a log file like `cat file; tail -n 0 -f file`.
//
// dump() emits the current contents and records the read offset; follow()
// then emits only bytes appended after that offset, so nothing is shown
// twice or skipped. A file that shrinks, is replaced by a new inode, or whose
// already-shown start was rewritten in place is treated as rotated and re-read
// from offset zero. A file that disappears
// ends the follow with LogLost.
class LogFollower {
public:
    enum class PollStatus {
        Idle,       // nothing new
        Data,       // emitted appended bytes
        Rotated,    // truncated or replaced; restarted at offset zero
        Lost,       // path no longer exists
    };

    LogFollower(const std::string& path, OutputCallback out, int poll_ms);
    ~LogFollower();

    LogFollower(const LogFollower&) = delete;
    LogFollower& operator=(const LogFollower&) = delete;

    // Emit the full current contents. Must be called before start()/poll_once().
    Result<void> dump();

    // One growth check. Public so callers without a thread can drive it.
    PollStatus poll_once();

    // Follow on a background thread until `token` is cancelled. On LogLost
    // the follower itself requests cancellation.
    void start(CancelToken& token);
    void join();

    const std::string& path() const { return path_; }
    uint64_t offset() const { return offset_; }
    int rotations() const { return rotations_.load(); }
    bool lost() const { return lost_.load(); }

private:
    bool open_current();
    void close_fd();
    uint64_t drain();
    void rewind();
    bool prefix_changed() const;
    void run(CancelToken& token);

    std::string path_;
    OutputCallback out_;
    int poll_ms_;

    int fd_ = -1;
    dev_t dev_ = 0;
    ino_t ino_ = 0;
    uint64_t offset_ = 0;
    std::string shown_prefix_;   // first LOG_PREFIX_CHECK_SIZE bytes emitted

    std::atomic<int> rotations_{0};
    std::atomic<bool> lost_{false};
    std::thread thread_;
};
