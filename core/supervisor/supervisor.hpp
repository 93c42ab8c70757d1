#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "catalog/i_app_catalog.hpp"
#include "ipc/frame_channel.hpp"
#include "ipc/i_child_handle.hpp"
#include "ipc/protocol.hpp"
#include "native/i_client_session.hpp"
#include "native/i_session_factory.hpp"

namespace statforge {
namespace supervisor {

struct SupervisorOptions {
    int worker_timeout_ms = 30000;   // deadline for one exchange with a worker (-1 = none)
    int shutdown_timeout_ms = 2000;  // wait for a stopped worker before killing it
};

// Supervisor routes front-end commands: it answers catalog and lifecycle
// commands itself and relays app-scoped commands to one worker process per
// app id. Worker replies are passed through as raw frames.
//
// The client session is opened lazily by the first command other than
// Shutdown and re-attempted on every command until it succeeds.
class Supervisor {
public:
    Supervisor(native::ISessionFactory &sessions, catalog::IAppCatalog &catalog, ipc::IWorkerSpawner &spawner,
               SupervisorOptions options);

    // Stops any remaining workers
    ~Supervisor();

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Answers one command. Clears keep_running after Shutdown.
    ipc::Frame handle(const ipc::Command &command, bool &keep_running);

    // Request/response loop over the front-end channel. Returns the exit status.
    int run(ipc::FrameChannel &channel);

    bool has_session() const { return session_ != nullptr; }
    size_t worker_count() const { return workers_.size(); }
    bool has_worker(uint32_t app_id) const { return workers_.count(app_id) > 0; }

private:
    bool ensure_session();

    ipc::Frame launch_app(uint32_t app_id);
    ipc::Frame stop_app(uint32_t app_id);
    ipc::Frame forward(const ipc::Command &command);

    // Sends Shutdown, reads the reply and reaps the process. Returns the
    // worker's reply, or Error(SocketCommunicationFailed).
    ipc::Frame stop_worker(uint32_t app_id, std::unique_ptr<ipc::IChildHandle> child);
    void stop_all_workers();

    void close_session();

    native::ISessionFactory &sessions_;
    catalog::IAppCatalog &catalog_;
    ipc::IWorkerSpawner &spawner_;
    SupervisorOptions options_;

    std::unique_ptr<native::IClientSession> session_;
    std::unordered_map<uint32_t, std::unique_ptr<ipc::IChildHandle>> workers_;
};

}  // namespace supervisor
}  // namespace statforge
