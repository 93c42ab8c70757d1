#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "ipc/i_child_handle.hpp"
#include "ipc/protocol.hpp"

namespace statforge {
namespace client {

struct SupervisorClientOptions {
    std::string executable_path;   // re-invoked with --orchestrator
    int request_timeout_ms = -1;   // per request round trip (-1 = none)
    int shutdown_timeout_ms = 2000;
    uint64_t max_frame_size = 64ull * 1024ull * 1024ull;
};

/**
 * @brief Front-end handle to the supervisor process.
 *
 * Owned by the front end's top-level controller and passed to whatever
 * needs to talk to the supervisor. shutdown() runs at most once; the
 * destructor calls it.
 */
class SupervisorClient {
public:
    // Spawns the supervisor. Returns nullptr on failure (sets error).
    static std::unique_ptr<SupervisorClient> launch(const SupervisorClientOptions &options, std::string &error);

    // Wraps an already running supervisor (tests)
    SupervisorClient(std::unique_ptr<ipc::IChildHandle> child, int request_timeout_ms, int shutdown_timeout_ms);
    ~SupervisorClient();

    SupervisorClient(const SupervisorClient &) = delete;
    SupervisorClient &operator=(const SupervisorClient &) = delete;

    /**
     * @brief Sends one command and decodes the typed reply.
     *
     * Transport failures and replies of the wrong shape are reported as
     * Error(SocketCommunicationFailed) and Error(SerializationFailed).
     */
    template <typename T>
    ipc::Response<T> request(const ipc::Command &command) {
        ipc::Frame reply;
        if (!exchange(command, reply)) {
            return ipc::Response<T>::error(last_error_kind_);
        }
        ipc::Response<T> response;
        std::string error;
        if (!ipc::decode_response(reply, response, error)) {
            last_error_ = error;
            return ipc::Response<T>::error(ipc::ErrorKind::SERIALIZATION_FAILED);
        }
        return response;
    }

    // Sends Shutdown and reaps the supervisor. Later calls do nothing.
    void shutdown();

    bool is_connected() const { return child_ != nullptr; }
    const std::string &last_error() const { return last_error_; }

private:
    bool exchange(const ipc::Command &command, ipc::Frame &reply);

    std::unique_ptr<ipc::IChildHandle> child_;
    int request_timeout_ms_;
    int shutdown_timeout_ms_;
    std::string last_error_;
    ipc::ErrorKind last_error_kind_ = ipc::ErrorKind::SOCKET_COMMUNICATION_FAILED;
};

}  // namespace client
}  // namespace statforge
