#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "frame_channel.hpp"

namespace statforge {
namespace ipc {

enum class ProcessRole { FRONT_END, SUPERVISOR, WORKER };

const char *process_role_to_string(ProcessRole role);

// Command line of any statforge process.
//   --orchestrator         run as supervisor
//   --app=<id>             run as worker for one app id
//   --tx=<fd> --rx=<fd>    inherited pipe ends (both or neither)
//   --config=<path>        configuration file
// Anything else is kept, in order, in `rest` for the front end.
struct LaunchArguments {
    bool orchestrator = false;
    uint32_t app_id = 0;
    int tx_fd = -1;
    int rx_fd = -1;
    std::string config_path;
    bool show_help = false;
    std::vector<std::string> rest;

    bool has_endpoints() const { return tx_fd >= 0 && rx_fd >= 0; }
    ProcessRole role() const;
};

// Returns false on malformed flags or when exactly one of --tx/--rx is present
bool parse_launch_arguments(int argc, const char *const *argv, LaunchArguments &out, std::string &error);

// Rebuilds the channel to the parent from the inherited descriptors.
// The channel takes ownership of both.
FrameChannel open_parent_channel(const LaunchArguments &args);

}  // namespace ipc
}  // namespace statforge
