#include "runtime.hpp"

#include <iostream>

#include "app_paths.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace statforge {
namespace runtime {

Runtime::Runtime(const StatforgeConfig &config, ipc::LaunchArguments args)
    : config_(config), args_(std::move(args)) {}

Runtime::~Runtime() {
    // Front end first: its shutdown waits for the supervisor tree to exit
    client_.reset();
    supervisor_.reset();
    worker_.reset();
}

native::SteamSessionOptions Runtime::session_options() const {
    native::SteamSessionOptions options;
    options.library_path = config_.steam.library_path;
    options.host_app_id = config_.steam.host_app_id;
    options.stats_wait_ms = config_.steam.stats_wait_ms;
    return options;
}

bool Runtime::initialize(std::string &error) {
    switch (args_.role()) {
        case ipc::ProcessRole::FRONT_END:
            SignalHandler::install();
            return init_front_end(error);
        case ipc::ProcessRole::SUPERVISOR:
            SignalHandler::install_for_child();
            return init_supervisor(error);
        case ipc::ProcessRole::WORKER:
            SignalHandler::install_for_child();
            return init_worker(error);
    }
    error = "Unknown process role";
    return false;
}

bool Runtime::init_front_end(std::string &error) {
    if (!client::parse_cli(args_.rest, cli_request_, error)) {
        return false;
    }
    if (!client::needs_supervisor(cli_request_)) {
        return true;
    }

    if (!self_executable_path(self_path_, error)) {
        return false;
    }

    client::SupervisorClientOptions options;
    options.executable_path = self_path_;
    options.request_timeout_ms = config_.ipc.request_timeout_ms;
    options.shutdown_timeout_ms = config_.ipc.shutdown_timeout_ms;
    options.max_frame_size = config_.ipc.max_frame_bytes;

    client_ = client::SupervisorClient::launch(options, error);
    if (!client_) {
        error = "Cannot start the supervisor: " + error;
        return false;
    }
    return true;
}

bool Runtime::init_supervisor(std::string &error) {
    if (!self_executable_path(self_path_, error)) {
        return false;
    }

    parent_channel_ = std::make_unique<ipc::FrameChannel>(ipc::open_parent_channel(args_));
    parent_channel_->set_max_frame_size(config_.ipc.max_frame_bytes);

    sessions_ = std::make_unique<native::SteamSessionFactory>(session_options());

    catalog::CatalogOptions catalog_options;
    catalog_options.url = config_.catalog.url;
    catalog_options.cache_path = config_.catalog.cache_path;
    catalog_options.max_age_hours = config_.catalog.max_age_hours;
    catalog_ = std::make_unique<catalog::AppCatalog>(catalog_options);

    spawner_ = std::make_unique<ipc::ProcessWorkerSpawner>(self_path_, config_.ipc.max_frame_bytes,
                                                           config_.ipc.shutdown_timeout_ms);

    supervisor::SupervisorOptions options;
    options.worker_timeout_ms = config_.ipc.worker_timeout_ms;
    options.shutdown_timeout_ms = config_.ipc.shutdown_timeout_ms;
    supervisor_ = std::make_unique<supervisor::Supervisor>(*sessions_, *catalog_, *spawner_, options);

    LOG_INFO("[Runtime] Supervisor initialised (catalog " << catalog_->options().cache_path << ")");
    return true;
}

bool Runtime::init_worker(std::string &error) {
    if (args_.app_id == 0) {
        error = "Worker requires --app=<id>";
        return false;
    }

    parent_channel_ = std::make_unique<ipc::FrameChannel>(ipc::open_parent_channel(args_));
    parent_channel_->set_max_frame_size(config_.ipc.max_frame_bytes);

    sessions_ = std::make_unique<native::SteamSessionFactory>(session_options());

    worker::WorkerOptions options;
    options.schema_dir = config_.steam.schema_dir;
    options.language = config_.steam.language;
    worker_ = std::make_unique<worker::Worker>(args_.app_id, *sessions_, options);
    return true;
}

int Runtime::run() {
    switch (args_.role()) {
        case ipc::ProcessRole::SUPERVISOR:
            return supervisor_->run(*parent_channel_);

        case ipc::ProcessRole::WORKER:
            return worker_->run(*parent_channel_);

        case ipc::ProcessRole::FRONT_END:
            break;
    }

    if (!client_) {
        return client::dump_schema(cli_request_.target, std::cout);
    }
    int status = client::run_cli(cli_request_, *client_, std::cout);
    client_->shutdown();
    return status;
}

}  // namespace runtime
}  // namespace statforge
