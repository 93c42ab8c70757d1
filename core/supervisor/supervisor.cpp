#include "supervisor.hpp"

#include "logging/logger.hpp"

namespace statforge {
namespace supervisor {

using ipc::Command;
using ipc::CommandType;
using ipc::ErrorKind;
using ipc::Frame;
using ipc::Response;

Supervisor::Supervisor(native::ISessionFactory &sessions, catalog::IAppCatalog &catalog,
                       ipc::IWorkerSpawner &spawner, SupervisorOptions options)
    : sessions_(sessions), catalog_(catalog), spawner_(spawner), options_(options) {}

Supervisor::~Supervisor() {
    stop_all_workers();
    close_session();
}

bool Supervisor::ensure_session() {
    if (session_) {
        return true;
    }
    std::string error;
    session_ = sessions_.connect_client(error);
    if (!session_) {
        LOG_ERROR("[Supervisor] Cannot connect to the client: " << error);
        return false;
    }
    LOG_INFO("[Supervisor] Connected to the client");
    return true;
}

void Supervisor::close_session() {
    if (session_) {
        session_->shutdown();
        session_.reset();
    }
}

Frame Supervisor::handle(const Command &command, bool &keep_running) {
    keep_running = true;

    if (command.type() == CommandType::SHUTDOWN) {
        stop_all_workers();
        close_session();
        keep_running = false;
        return ipc::reply_frame(Response<bool>::success(true));
    }

    if (!ensure_session()) {
        return ipc::error_frame(ErrorKind::STEAM_CONNECTION_FAILED);
    }

    switch (command.type()) {
        case CommandType::GET_OWNED_APP_LIST:
            return ipc::reply_frame(catalog_.owned_apps(*session_));

        case CommandType::LAUNCH_APP:
            return launch_app(command.app_id());

        case CommandType::STOP_APP:
            return stop_app(command.app_id());

        case CommandType::STOP_APPS:
            stop_all_workers();
            return ipc::reply_frame(Response<bool>::success(true));

        case CommandType::STATUS:
            return ipc::reply_frame(Response<bool>::success(true));

        default:
            if (command.is_app_scoped()) {
                return forward(command);
            }
            LOG_WARN("[Supervisor] Unhandled command: " << command);
            return ipc::error_frame(ErrorKind::UNKNOWN);
    }
}

Frame Supervisor::launch_app(uint32_t app_id) {
    if (workers_.count(app_id) > 0) {
        LOG_WARN("[Supervisor] App " << app_id << " is already running");
        return ipc::error_frame(ErrorKind::UNKNOWN);
    }

    std::string error;
    auto child = spawner_.spawn_worker(app_id, error);
    if (!child) {
        LOG_ERROR("[Supervisor] Cannot launch worker for app " << app_id << ": " << error);
        return ipc::error_frame(ErrorKind::UNKNOWN);
    }

    LOG_INFO("[Supervisor] Launched worker for app " << app_id << " (pid " << child->pid() << ")");
    workers_.emplace(app_id, std::move(child));
    return ipc::reply_frame(Response<bool>::success(true));
}

Frame Supervisor::stop_app(uint32_t app_id) {
    auto it = workers_.find(app_id);
    if (it == workers_.end()) {
        LOG_WARN("[Supervisor] App " << app_id << " is not running");
        return ipc::error_frame(ErrorKind::UNKNOWN);
    }

    std::unique_ptr<ipc::IChildHandle> child = std::move(it->second);
    workers_.erase(it);
    return stop_worker(app_id, std::move(child));
}

Frame Supervisor::stop_worker(uint32_t app_id, std::unique_ptr<ipc::IChildHandle> child) {
    Frame request;
    std::string error;
    if (!ipc::encode_command(Command::shutdown(), request, error)) {
        // Unit commands always encode
        child->terminate();
        return ipc::error_frame(ErrorKind::SERIALIZATION_FAILED);
    }

    Frame reply;
    bool exchanged =
        child->send(request, options_.worker_timeout_ms) && child->receive(reply, options_.worker_timeout_ms);
    if (!exchanged) {
        LOG_WARN("[Supervisor] Worker for app " << app_id << " did not acknowledge shutdown: "
                                                 << child->last_error());
        child->terminate();
        return ipc::error_frame(ErrorKind::SOCKET_COMMUNICATION_FAILED);
    }

    if (!child->wait_for_exit(options_.shutdown_timeout_ms)) {
        LOG_WARN("[Supervisor] Worker for app " << app_id << " did not exit, killing pid " << child->pid());
        child->terminate();
    }
    LOG_INFO("[Supervisor] Stopped worker for app " << app_id);
    return reply;
}

void Supervisor::stop_all_workers() {
    if (workers_.empty()) {
        return;
    }
    LOG_INFO("[Supervisor] Stopping " << workers_.size() << " worker(s)");

    std::unordered_map<uint32_t, std::unique_ptr<ipc::IChildHandle>> workers;
    workers.swap(workers_);
    for (auto &entry : workers) {
        stop_worker(entry.first, std::move(entry.second));
    }
}

Frame Supervisor::forward(const Command &command) {
    auto it = workers_.find(command.app_id());
    if (it == workers_.end()) {
        LOG_WARN("[Supervisor] No worker for app " << command.app_id() << ", dropping " << command);
        return ipc::error_frame(ErrorKind::APP_MISMATCH);
    }
    ipc::IChildHandle &child = *it->second;

    Frame request;
    std::string error;
    if (!ipc::encode_command(command, request, error)) {
        LOG_WARN("[Supervisor] Cannot encode " << command << ": " << error);
        return ipc::error_frame(ErrorKind::SERIALIZATION_FAILED);
    }

    Frame reply;
    if (child.send(request, options_.worker_timeout_ms) && child.receive(reply, options_.worker_timeout_ms)) {
        return reply;
    }

    LOG_ERROR("[Supervisor] Exchange with worker for app " << command.app_id() << " failed: "
                                                           << child.last_error());
    if (child.timed_out()) {
        // A late reply would be read as the answer to the next command
        LOG_WARN("[Supervisor] Killing unresponsive worker for app " << command.app_id());
        child.terminate();
        workers_.erase(it);
    }
    return ipc::error_frame(ErrorKind::SOCKET_COMMUNICATION_FAILED);
}

int Supervisor::run(ipc::FrameChannel &channel) {
    LOG_INFO("[Supervisor] Ready");

    bool keep_running = true;
    while (keep_running) {
        Frame request;
        if (!channel.read_frame(request)) {
            LOG_INFO("[Supervisor] Front-end channel closed: " << channel.last_error());
            break;
        }

        Command command = Command::status();
        std::string error;
        Frame reply;
        if (!ipc::decode_command(request, command, error)) {
            LOG_WARN("[Supervisor] Undecodable command: " << error);
            reply = ipc::error_frame(ErrorKind::SERIALIZATION_FAILED);
        } else {
            LOG_DEBUG("[Supervisor] <- " << command);
            reply = handle(command, keep_running);
        }

        if (!channel.write_frame(reply)) {
            LOG_ERROR("[Supervisor] Cannot write reply: " << channel.last_error());
            break;
        }
    }

    stop_all_workers();
    close_session();
    LOG_INFO("[Supervisor] Exiting");
    return 0;
}

}  // namespace supervisor
}  // namespace statforge
