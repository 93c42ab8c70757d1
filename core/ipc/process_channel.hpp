#pragma once

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "frame_channel.hpp"
#include "i_child_handle.hpp"

namespace statforge {
namespace ipc {

// Grace period given to a child after its pipes are closed in ~ChildHandle
constexpr int kDefaultShutdownTimeoutMs = 2000;

// ChildHandle manages one child process spawned with a private pipe pair.
// The child learns its endpoints from two appended flags:
//   --tx=<fd>  descriptor the child writes to
//   --rx=<fd>  descriptor the child reads from
// The parent-facing ends are close-on-exec so sibling children never inherit
// them.
class ChildHandle : public IChildHandle {
public:
    // Returns nullptr on failure (sets error). No descriptor leaks on failure.
    static std::unique_ptr<ChildHandle> spawn(const std::string &tag, const std::string &executable_path,
                                              const std::vector<std::string> &args, std::string &error);

    // Shutdown sequence: EOF -> wait -> kill
    ~ChildHandle() override;

    ChildHandle(const ChildHandle &) = delete;
    ChildHandle &operator=(const ChildHandle &) = delete;

    bool send(const Frame &frame, int timeout_ms) override;
    bool receive(Frame &out, int timeout_ms) override;
    bool timed_out() const override { return channel_.timed_out(); }

    int wait() override;
    bool wait_for_exit(int timeout_ms) override;
    void terminate() override;

    bool is_running() const;
    int pid() const override { return static_cast<int>(pid_); }
    const std::string &last_error() const override { return channel_.last_error(); }

    FrameChannel &channel() { return channel_; }
    void set_shutdown_timeout(int timeout_ms) { shutdown_timeout_ms_ = timeout_ms; }

private:
    ChildHandle(std::string tag, pid_t pid, FrameChannel channel);

    std::string tag_;
    pid_t pid_;
    FrameChannel channel_;
    int shutdown_timeout_ms_ = kDefaultShutdownTimeoutMs;
};

// Spawns workers by re-invoking an executable (normally this one) with --app=<id>
class ProcessWorkerSpawner : public IWorkerSpawner {
public:
    ProcessWorkerSpawner(std::string executable_path, uint64_t max_frame_size, int shutdown_timeout_ms);

    std::unique_ptr<IChildHandle> spawn_worker(uint32_t app_id, std::string &error) override;

private:
    std::string executable_path_;
    uint64_t max_frame_size_;
    int shutdown_timeout_ms_;
};

}  // namespace ipc
}  // namespace statforge
