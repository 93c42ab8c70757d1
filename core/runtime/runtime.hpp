#pragma once

#include <memory>
#include <string>

#include "catalog/app_catalog.hpp"
#include "client/cli.hpp"
#include "client/supervisor_client.hpp"
#include "config.hpp"
#include "ipc/endpoint_args.hpp"
#include "ipc/frame_channel.hpp"
#include "ipc/process_channel.hpp"
#include "native/steam_sessions.hpp"
#include "supervisor/supervisor.hpp"
#include "worker/worker.hpp"

namespace statforge {
namespace runtime {

// Composition root of one statforge process. The same executable runs as
// front end, supervisor or worker depending on its launch arguments; the
// Runtime wires the components of that role only.
class Runtime {
public:
    Runtime(const StatforgeConfig &config, ipc::LaunchArguments args);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Builds the components of the role. False on misuse or setup failure.
    bool initialize(std::string &error);

    // Runs the role to completion and returns the process exit status
    int run();

    ipc::ProcessRole role() const { return args_.role(); }

private:
    bool init_front_end(std::string &error);
    bool init_supervisor(std::string &error);
    bool init_worker(std::string &error);

    native::SteamSessionOptions session_options() const;

    StatforgeConfig config_;
    ipc::LaunchArguments args_;
    std::string self_path_;

    // Front end
    client::CliRequest cli_request_;
    std::unique_ptr<client::SupervisorClient> client_;

    // Supervisor and worker
    std::unique_ptr<ipc::FrameChannel> parent_channel_;
    std::unique_ptr<native::SteamSessionFactory> sessions_;
    std::unique_ptr<catalog::AppCatalog> catalog_;
    std::unique_ptr<ipc::ProcessWorkerSpawner> spawner_;
    std::unique_ptr<supervisor::Supervisor> supervisor_;
    std::unique_ptr<worker::Worker> worker_;
};

}  // namespace runtime
}  // namespace statforge
