#include "log_follower.hpp"
#include "monitor_log.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

LogFollower::LogFollower(const std::string& path, OutputCallback out, int poll_ms)
    : path_(path), out_(std::move(out)), poll_ms_(poll_ms) {}

LogFollower::~LogFollower() {
    join();
    close_fd();
}

bool LogFollower::open_current() {
    close_fd();
    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    struct stat st;
    if (fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    fd_ = fd;
    dev_ = st.st_dev;
    ino_ = st.st_ino;
    rewind();
    return true;
}

void LogFollower::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void LogFollower::rewind() {
    offset_ = 0;
    shown_prefix_.clear();
}

// True if the start of the file no longer matches what was already shown,
// i.e. the writer reopened it with O_TRUNC and wrote past the old length.
bool LogFollower::prefix_changed() const {
    if (fd_ < 0 || shown_prefix_.empty()) return false;

    std::string current(shown_prefix_.size(), '\0');
    size_t got = 0;
    while (got < current.size()) {
        ssize_t n = ::pread(fd_, &current[got], current.size() - got, static_cast<off_t>(got));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    current.resize(got);
    return current != shown_prefix_;
}

// Emit everything between offset_ and the current end of file.
uint64_t LogFollower::drain() {
    if (fd_ < 0) return 0;

    char buf[LOG_READ_BUF_SIZE];
    uint64_t total = 0;
    while (true) {
        ssize_t n = ::pread(fd_, buf, sizeof(buf), static_cast<off_t>(offset_));
        if (n < 0) {
            if (errno == EINTR) continue;
            hps_log(fmt::format("LogFollower: read {} failed: {}", path_, std::strerror(errno)));
            break;
        }
        if (n == 0) break;
        if (shown_prefix_.size() < static_cast<size_t>(LOG_PREFIX_CHECK_SIZE)) {
            size_t keep = std::min(static_cast<size_t>(n),
                                   LOG_PREFIX_CHECK_SIZE - shown_prefix_.size());
            shown_prefix_.append(buf, keep);
        }
        offset_ += static_cast<uint64_t>(n);
        total += static_cast<uint64_t>(n);
        if (out_) out_(std::string(buf, static_cast<size_t>(n)));
    }
    return total;
}

Result<void> LogFollower::dump() {
    if (!open_current()) {
        return Result<void>::Err(ErrorCode::LogNotFound,
            fmt::format("Cannot open log {}: {}", path_, std::strerror(errno)));
    }
    uint64_t n = drain();
    hps_log(fmt::format("LogFollower: dumped {} bytes of {}", n, path_));
    return Result<void>::Ok();
}

LogFollower::PollStatus LogFollower::poll_once() {
    if (lost_.load()) return PollStatus::Lost;

    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        // Show whatever was written before the file vanished
        drain();
        close_fd();
        lost_.store(true);
        hps_log(fmt::format("LogFollower: {} disappeared at offset {}", path_, offset_));
        return PollStatus::Lost;
    }

    if (fd_ < 0 || st.st_ino != ino_ || st.st_dev != dev_) {
        // Replaced by a new file: finish the old one, then start the new one at zero
        drain();
        if (!open_current()) {
            return PollStatus::Idle;   // vanished between stat and open; next poll decides
        }
        rotations_.fetch_add(1);
        hps_log(fmt::format("LogFollower: {} rotated (new inode)", path_));
        drain();
        return PollStatus::Rotated;
    }

    struct stat fst;
    if (fstat(fd_, &fst) == 0 && static_cast<uint64_t>(fst.st_size) < offset_) {
        hps_log(fmt::format("LogFollower: {} truncated ({} < {})", path_,
                            static_cast<uint64_t>(fst.st_size), offset_));
        rewind();
        rotations_.fetch_add(1);
        drain();
        return PollStatus::Rotated;
    }

    if (prefix_changed()) {
        hps_log(fmt::format("LogFollower: {} rewritten in place", path_));
        rewind();
        rotations_.fetch_add(1);
        drain();
        return PollStatus::Rotated;
    }

    return drain() > 0 ? PollStatus::Data : PollStatus::Idle;
}

void LogFollower::start(CancelToken& token) {
    thread_ = std::thread(&LogFollower::run, this, std::ref(token));
}

void LogFollower::join() {
    if (thread_.joinable()) thread_.join();
}

void LogFollower::run(CancelToken& token) {
    while (!token.requested()) {
        if (poll_once() == PollStatus::Lost) {
            token.request(StopReason::LogLost);
            break;
        }
        if (token.wait_for(poll_ms_)) break;
    }
    hps_log(fmt::format("LogFollower: stopped ({}) at offset {}",
                        stop_reason_name(token.reason()), offset_));
}
