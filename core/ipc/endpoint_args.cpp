#include "endpoint_args.hpp"

#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace statforge {
namespace ipc {

namespace {

bool parse_number(const std::string &text, unsigned long long max, unsigned long long &out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool parse_fd(const std::string &flag, const std::string &text, int &out, std::string &error) {
    unsigned long long value = 0;
    if (!parse_number(text, static_cast<unsigned long long>(std::numeric_limits<int>::max()), value)) {
        error = "Invalid value for " + flag + ": " + text;
        return false;
    }
    out = static_cast<int>(value);
    if (fcntl(out, F_GETFD) < 0) {
        error = "Descriptor passed with " + flag + " is not open: " + text;
        return false;
    }
    return true;
}

bool starts_with(const std::string &s, const char *prefix, std::string &value) {
    std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) {
        return false;
    }
    value = s.substr(p.size());
    return true;
}

}  // namespace

const char *process_role_to_string(ProcessRole role) {
    switch (role) {
        case ProcessRole::SUPERVISOR:
            return "supervisor";
        case ProcessRole::WORKER:
            return "worker";
        case ProcessRole::FRONT_END:
        default:
            return "ui";
    }
}

ProcessRole LaunchArguments::role() const {
    if (orchestrator) {
        return ProcessRole::SUPERVISOR;
    }
    if (app_id != 0) {
        return ProcessRole::WORKER;
    }
    return ProcessRole::FRONT_END;
}

bool parse_launch_arguments(int argc, const char *const *argv, LaunchArguments &out, std::string &error) {
    out = LaunchArguments();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--orchestrator") {
            out.orchestrator = true;
        } else if (starts_with(arg, "--app=", value)) {
            unsigned long long app_id = 0;
            if (!parse_number(value, std::numeric_limits<uint32_t>::max(), app_id) || app_id == 0) {
                error = "Invalid value for --app: " + value;
                return false;
            }
            out.app_id = static_cast<uint32_t>(app_id);
        } else if (starts_with(arg, "--tx=", value)) {
            if (!parse_fd("--tx", value, out.tx_fd, error)) {
                return false;
            }
        } else if (starts_with(arg, "--rx=", value)) {
            if (!parse_fd("--rx", value, out.rx_fd, error)) {
                return false;
            }
        } else if (starts_with(arg, "--config=", value)) {
            out.config_path = value;
        } else if (arg == "--config" && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            out.show_help = true;
        } else {
            out.rest.push_back(arg);
        }
    }

    if ((out.tx_fd >= 0) != (out.rx_fd >= 0)) {
        error = "Invalid arguments, --tx and --rx must be provided together";
        return false;
    }
    if (out.orchestrator && out.app_id != 0) {
        error = "--orchestrator and --app are mutually exclusive";
        return false;
    }
    if (out.role() != ProcessRole::FRONT_END && !out.has_endpoints()) {
        error = std::string(process_role_to_string(out.role())) + " mode requires --tx and --rx";
        return false;
    }

    return true;
}

FrameChannel open_parent_channel(const LaunchArguments &args) {
    // Keep the descriptors out of any process this one spawns
    fcntl(args.rx_fd, F_SETFD, FD_CLOEXEC);
    fcntl(args.tx_fd, F_SETFD, FD_CLOEXEC);
    return FrameChannel(args.rx_fd, args.tx_fd);
}

}  // namespace ipc
}  // namespace statforge
