#include "supervisor_client.hpp"

#include "ipc/process_channel.hpp"
#include "logging/logger.hpp"

namespace statforge {
namespace client {

std::unique_ptr<SupervisorClient> SupervisorClient::launch(const SupervisorClientOptions &options,
                                                           std::string &error) {
    auto child = ipc::ChildHandle::spawn("supervisor", options.executable_path, {"--orchestrator"}, error);
    if (!child) {
        return nullptr;
    }
    child->channel().set_max_frame_size(options.max_frame_size);
    child->set_shutdown_timeout(options.shutdown_timeout_ms);
    LOG_DEBUG("[Client] Supervisor started (pid " << child->pid() << ")");
    return std::make_unique<SupervisorClient>(std::move(child), options.request_timeout_ms,
                                              options.shutdown_timeout_ms);
}

SupervisorClient::SupervisorClient(std::unique_ptr<ipc::IChildHandle> child, int request_timeout_ms,
                                   int shutdown_timeout_ms)
    : child_(std::move(child)), request_timeout_ms_(request_timeout_ms), shutdown_timeout_ms_(shutdown_timeout_ms) {}

SupervisorClient::~SupervisorClient() { shutdown(); }

bool SupervisorClient::exchange(const ipc::Command &command, ipc::Frame &reply) {
    if (!child_) {
        last_error_ = "Supervisor is not running";
        last_error_kind_ = ipc::ErrorKind::SOCKET_COMMUNICATION_FAILED;
        return false;
    }

    ipc::Frame request;
    std::string error;
    if (!ipc::encode_command(command, request, error)) {
        last_error_ = error;
        last_error_kind_ = ipc::ErrorKind::SERIALIZATION_FAILED;
        return false;
    }

    if (!child_->send(request, request_timeout_ms_) || !child_->receive(reply, request_timeout_ms_)) {
        last_error_ = child_->last_error();
        last_error_kind_ = ipc::ErrorKind::SOCKET_COMMUNICATION_FAILED;
        LOG_ERROR("[Client] " << command << " failed: " << last_error_);
        if (child_->timed_out()) {
            // A late reply would be read as the answer to the next command
            LOG_WARN("[Client] Killing unresponsive supervisor (pid " << child_->pid() << ")");
            child_->terminate();
            child_.reset();
        }
        return false;
    }
    return true;
}

void SupervisorClient::shutdown() {
    if (!child_) {
        return;
    }

    auto reply = request<bool>(ipc::Command::shutdown());
    if (!reply.ok()) {
        LOG_WARN("[Client] Supervisor did not acknowledge shutdown: " << ipc::error_kind_to_string(reply.error_kind()));
    }
    if (!child_->wait_for_exit(shutdown_timeout_ms_)) {
        LOG_WARN("[Client] Supervisor did not exit, killing pid " << child_->pid());
        child_->terminate();
    }
    child_.reset();
}

}  // namespace client
}  // namespace statforge
