#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "app_manager.hpp"
#include "ipc/frame_channel.hpp"
#include "ipc/protocol.hpp"
#include "native/i_session_factory.hpp"

namespace statforge {
namespace worker {

struct WorkerOptions {
    std::string schema_dir;  // empty: the detected Steam appcache
    std::string language;    // empty: the client's current language
};

/**
 * @brief Serves commands for exactly one app id.
 *
 * Connects to the client once, at construction, scoped to its app id. A
 * failed connection is not retried: from then on every command except
 * Shutdown is answered with Error(SteamConnectionFailed).
 */
class Worker {
public:
    Worker(uint32_t app_id, native::ISessionFactory &factory, WorkerOptions options);
    ~Worker();

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    // Answers one command. Clears keep_running when the loop should end.
    ipc::Frame handle(const ipc::Command &command, bool &keep_running);

    // Request/response loop over the parent channel. Returns the exit status.
    int run(ipc::FrameChannel &channel);

    uint32_t app_id() const { return app_id_; }
    bool connected() const { return manager_ != nullptr; }

private:
    ipc::Frame dispatch(const ipc::Command &command, bool &keep_running);

    uint32_t app_id_;
    std::unique_ptr<AppManager> manager_;
};

}  // namespace worker
}  // namespace statforge
