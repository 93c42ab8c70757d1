#include "frame_channel.hpp"

#include <errno.h>
#include <limits.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace statforge {
namespace ipc {

namespace {

using Clock = std::chrono::steady_clock;

// Milliseconds left until deadline, or -1 when there is no deadline
int remaining_ms(int timeout_ms, Clock::time_point start) {
    if (timeout_ms < 0) {
        return -1;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    if (elapsed >= timeout_ms) {
        return 0;
    }
    return static_cast<int>(timeout_ms - elapsed);
}

void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

FrameChannel::FrameChannel(int read_fd, int write_fd) : read_fd_(read_fd), write_fd_(write_fd) {}

FrameChannel::~FrameChannel() { close(); }

FrameChannel::FrameChannel(FrameChannel &&other) noexcept
    : read_fd_(other.read_fd_),
      write_fd_(other.write_fd_),
      max_frame_size_(other.max_frame_size_),
      error_(std::move(other.error_)),
      timed_out_(other.timed_out_) {
    other.read_fd_ = -1;
    other.write_fd_ = -1;
}

FrameChannel &FrameChannel::operator=(FrameChannel &&other) noexcept {
    if (this != &other) {
        close();
        read_fd_ = other.read_fd_;
        write_fd_ = other.write_fd_;
        max_frame_size_ = other.max_frame_size_;
        error_ = std::move(other.error_);
        timed_out_ = other.timed_out_;
        other.read_fd_ = -1;
        other.write_fd_ = -1;
    }
    return *this;
}

bool FrameChannel::write_frame(const Frame &frame, int timeout_ms) {
    error_.clear();
    timed_out_ = false;

    if (write_fd_ < 0) {
        error_ = "Channel has no write end";
        return false;
    }

    uint64_t len = frame.size();
    if (len > max_frame_size_) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    // Header and payload go out in one buffer so a frame is never split by
    // a failure between the two writes
    std::vector<uint8_t> buf(kFrameHeaderSize + frame.payload.size());
    for (size_t i = 0; i < kFrameHeaderSize; ++i) {
        buf[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    }
    std::copy(frame.payload.begin(), frame.payload.end(), buf.begin() + kFrameHeaderSize);

    return write_exact(buf.data(), buf.size(), timeout_ms);
}

bool FrameChannel::read_frame(Frame &out, int timeout_ms) {
    error_.clear();
    timed_out_ = false;

    if (read_fd_ < 0) {
        error_ = "Channel has no read end";
        return false;
    }

    auto start = Clock::now();

    uint8_t len_buf[kFrameHeaderSize];
    if (!read_exact(len_buf, kFrameHeaderSize, timeout_ms, "frame length")) {
        return false;
    }

    uint64_t len = 0;
    for (size_t i = 0; i < kFrameHeaderSize; ++i) {
        len |= uint64_t(len_buf[i]) << (8 * i);
    }

    if (len > max_frame_size_) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    out.payload.resize(static_cast<size_t>(len));
    if (len > 0) {
        int left = remaining_ms(timeout_ms, start);
        if (left == 0) {
            timed_out_ = true;
            error_ = "Timeout reading frame payload";
            return false;
        }
        if (!read_exact(out.payload.data(), out.payload.size(), left, "frame payload")) {
            return false;
        }
    }

    return true;
}

bool FrameChannel::wait_for_data(int timeout_ms) {
    if (read_fd_ < 0) {
        error_ = "Invalid read pipe";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }

    // POLLHUP with no POLLIN is EOF; let read() report it
    if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
        return true;
    }
    error_ = "poll error on read pipe";
    return false;
}

bool FrameChannel::wait_writable(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = write_fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }
    if ((pfd.revents & POLLOUT) != 0) {
        return true;
    }
    // POLLERR on a pipe write end means the reader is gone
    error_ = "Broken pipe (peer terminated)";
    return false;
}

bool FrameChannel::write_exact(const uint8_t *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start = Clock::now();

    while (total < n) {
        size_t chunk = n - total;
        if (timeout_ms >= 0) {
            int left = remaining_ms(timeout_ms, start);
            if (left == 0 || !wait_writable(left)) {
                if (error_.empty()) {
                    timed_out_ = true;
                    error_ = "Timeout writing frame";
                }
                return false;
            }
            // At most PIPE_BUF bytes fit once the pipe reports writable
            chunk = std::min<size_t>(chunk, PIPE_BUF);
        }

        ssize_t w = ::write(write_fd_, buf + total, chunk);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (peer terminated)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool FrameChannel::read_exact(uint8_t *buf, size_t n, int timeout_ms, const char *what) {
    size_t total = 0;
    auto start = Clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            int left = remaining_ms(timeout_ms, start);
            if (left == 0 || !wait_for_data(left)) {
                if (error_.empty()) {
                    timed_out_ = true;
                    error_ = std::string("Timeout reading ") + what;
                }
                return false;
            }
        }

        ssize_t r = ::read(read_fd_, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            error_ = std::string("EOF reading ") + what;
            return false;
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

void FrameChannel::close_write() { close_fd(write_fd_); }

void FrameChannel::close_read() { close_fd(read_fd_); }

void FrameChannel::close() {
    close_write();
    close_read();
}

}  // namespace ipc
}  // namespace statforge
