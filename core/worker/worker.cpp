#include "worker.hpp"

#include <filesystem>

#include "logging/logger.hpp"
#include "runtime/app_paths.hpp"

namespace statforge {
namespace worker {

using ipc::Command;
using ipc::CommandType;
using ipc::ErrorKind;
using ipc::Frame;
using ipc::Response;

Worker::Worker(uint32_t app_id, native::ISessionFactory &factory, WorkerOptions options) : app_id_(app_id) {
    std::string error;
    auto session = factory.connect_app(app_id_, error);
    if (!session) {
        LOG_ERROR("[Worker] Cannot connect to the client for app " << app_id_ << ": " << error);
        return;
    }

    std::filesystem::path schema_path;
    if (!runtime::schema_file_path(options.schema_dir, app_id_, schema_path, error)) {
        // Reported again by every read that needs the schema
        LOG_WARN("[Worker] " << error);
    }
    manager_ = std::make_unique<AppManager>(std::move(session), schema_path.string(), options.language);
    LOG_INFO("[Worker] Connected for app " << app_id_);
}

Worker::~Worker() = default;

Frame Worker::handle(const Command &command, bool &keep_running) {
    keep_running = true;

    if (!manager_) {
        if (command.type() == CommandType::SHUTDOWN) {
            keep_running = false;
            return ipc::reply_frame(Response<bool>::success(true));
        }
        return ipc::error_frame(ErrorKind::STEAM_CONNECTION_FAILED);
    }

    if (command.is_app_scoped() && command.app_id() != app_id_) {
        LOG_WARN("[Worker] Rejecting " << command << ": this worker serves app " << app_id_);
        return ipc::error_frame(ErrorKind::APP_MISMATCH);
    }

    return dispatch(command, keep_running);
}

Frame Worker::dispatch(const Command &command, bool &keep_running) {
    switch (command.type()) {
        case CommandType::STATUS:
            return ipc::reply_frame(Response<bool>::success(true));

        case CommandType::SHUTDOWN:
            manager_->disconnect();
            keep_running = false;
            return ipc::reply_frame(Response<bool>::success(true));

        case CommandType::GET_ACHIEVEMENTS:
            return ipc::reply_frame(manager_->get_achievements());

        case CommandType::GET_STATS:
            return ipc::reply_frame(manager_->get_stats());

        case CommandType::SET_ACHIEVEMENT:
            return ipc::reply_frame(manager_->set_achievement(command.target_id(), command.unlocked()));

        case CommandType::SET_INT_STAT:
            return ipc::reply_frame(manager_->set_int_stat(command.target_id(), command.int_value()));

        case CommandType::SET_FLOAT_STAT:
            return ipc::reply_frame(manager_->set_float_stat(command.target_id(), command.float_value()));

        case CommandType::RESET_STATS:
            return ipc::reply_frame(manager_->reset_all_stats(command.include_achievements()));

        default:
            LOG_WARN("[Worker] Command not served by a worker: " << command);
            return ipc::error_frame(ErrorKind::UNKNOWN);
    }
}

int Worker::run(ipc::FrameChannel &channel) {
    LOG_INFO("[Worker] Serving app " << app_id_);

    bool keep_running = true;
    while (keep_running) {
        Frame request;
        if (!channel.read_frame(request)) {
            LOG_INFO("[Worker] Inbound channel closed: " << channel.last_error());
            break;
        }

        Command command = Command::status();
        std::string error;
        Frame reply;
        if (!ipc::decode_command(request, command, error)) {
            LOG_WARN("[Worker] Undecodable command: " << error);
            reply = ipc::error_frame(ErrorKind::SERIALIZATION_FAILED);
        } else {
            LOG_DEBUG("[Worker] <- " << command);
            reply = handle(command, keep_running);
        }

        if (!channel.write_frame(reply)) {
            LOG_ERROR("[Worker] Cannot write reply: " << channel.last_error());
            break;
        }
    }

    if (manager_) {
        manager_->disconnect();
    }
    LOG_INFO("[Worker] Exiting");
    return 0;
}

}  // namespace worker
}  // namespace statforge
