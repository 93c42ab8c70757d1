#pragma once

#include <cstdint>
#include <string>

#include "protocol.hpp"

namespace statforge {
namespace ipc {

// Default upper bound for a single frame payload: 64 MiB
constexpr uint64_t kDefaultMaxFrameSize = 64ull * 1024ull * 1024ull;

// Size of the frame header: uint64 little-endian payload length
constexpr size_t kFrameHeaderSize = 8;

// FrameChannel owns one read end and one write end of a pipe pair and moves
// length-prefixed frames across them. Frames are: uint64_le (length) + payload.
//
// Timeouts are in milliseconds; -1 blocks forever. A timeout in the middle of
// a frame leaves the stream unaligned, so callers must drop the channel.
class FrameChannel {
public:
    FrameChannel() = default;
    // Takes ownership of both descriptors. Either may be -1.
    FrameChannel(int read_fd, int write_fd);
    ~FrameChannel();

    FrameChannel(const FrameChannel &) = delete;
    FrameChannel &operator=(const FrameChannel &) = delete;
    FrameChannel(FrameChannel &&other) noexcept;
    FrameChannel &operator=(FrameChannel &&other) noexcept;

    // Returns true on success, false on error (sets error_)
    bool write_frame(const Frame &frame, int timeout_ms = -1);

    // Returns true on success, false on EOF, timeout or error (sets error_)
    bool read_frame(Frame &out, int timeout_ms = -1);

    // Returns true if data is readable, false on timeout or error (sets error_ on error)
    bool wait_for_data(int timeout_ms);

    void set_max_frame_size(uint64_t max_bytes) { max_frame_size_ = max_bytes; }

    // Closing the write end signals EOF to the peer
    void close_write();
    void close_read();
    void close();

    int read_fd() const { return read_fd_; }
    int write_fd() const { return write_fd_; }
    bool can_read() const { return read_fd_ >= 0; }
    bool can_write() const { return write_fd_ >= 0; }

    const std::string &last_error() const { return error_; }
    // True when the last failed operation ran out of time
    bool timed_out() const { return timed_out_; }

private:
    int read_fd_ = -1;
    int write_fd_ = -1;
    uint64_t max_frame_size_ = kDefaultMaxFrameSize;
    std::string error_;
    bool timed_out_ = false;

    bool read_exact(uint8_t *buf, size_t n, int timeout_ms, const char *what);
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms);
    bool wait_writable(int timeout_ms);
};

}  // namespace ipc
}  // namespace statforge
