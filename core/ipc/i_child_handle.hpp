#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "protocol.hpp"

namespace statforge {
namespace ipc {

/**
 * @brief Supervisor-side view of one spawned child process.
 *
 * Owns the OS process plus the send and receive halves of its pipe pair.
 * Abstract so the supervisor can be exercised without real processes.
 */
class IChildHandle {
public:
    virtual ~IChildHandle() = default;

    // Frame transport. timeout_ms = -1 blocks forever.
    virtual bool send(const Frame &frame, int timeout_ms) = 0;
    virtual bool receive(Frame &out, int timeout_ms) = 0;

    // True when the last failed send/receive ran out of time
    virtual bool timed_out() const = 0;

    // Blocking reap. Returns the exit status, or -1 if it cannot be determined.
    virtual int wait() = 0;

    // Reap with a deadline. Returns false if the child is still running.
    virtual bool wait_for_exit(int timeout_ms) = 0;

    // Forced kill followed by a reap
    virtual void terminate() = 0;

    virtual int pid() const = 0;
    virtual const std::string &last_error() const = 0;
};

// Creates worker processes for the supervisor
class IWorkerSpawner {
public:
    virtual ~IWorkerSpawner() = default;

    // Returns nullptr on failure (sets error)
    virtual std::unique_ptr<IChildHandle> spawn_worker(uint32_t app_id, std::string &error) = 0;
};

}  // namespace ipc
}  // namespace statforge
