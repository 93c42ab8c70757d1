// statforge
// One executable, three roles: front end (default), supervisor
// (--orchestrator) and per-app worker (--app=<id>)

#include <stdlib.h>

#include <iostream>
#include <string>

#include "client/cli.hpp"
#include "ipc/endpoint_args.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"

int main(int argc, char **argv)
{
    statforge::ipc::LaunchArguments args;
    std::string error;

    if (!statforge::ipc::parse_launch_arguments(argc, argv, args, error))
    {
        std::cerr << "ERROR: " << error << "\n";
        std::cerr << "Use --help for usage information\n";
        return statforge::client::kExitUsage;
    }

    if (args.show_help)
    {
        statforge::client::print_usage(std::cerr);
        return statforge::client::kExitOk;
    }

    std::string role = statforge::ipc::process_role_to_string(args.role());
    if (args.role() == statforge::ipc::ProcessRole::WORKER)
    {
        role += ":" + std::to_string(args.app_id);
    }
    statforge::logging::Logger::init(statforge::logging::Level::LVL_INFO, role);

    // Load configuration; children find it through the environment
    statforge::runtime::StatforgeConfig config;
    std::string config_path = statforge::runtime::resolve_config_path(args.config_path);
    if (!config_path.empty())
    {
        if (!statforge::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return statforge::client::kExitUsage;
        }
        setenv(statforge::runtime::kConfigEnvVar, config_path.c_str(), 1);
    }
    statforge::runtime::apply_env_overrides(config);

    statforge::logging::Logger::set_level(statforge::logging::string_to_level(config.logging.level));
    LOG_DEBUG("Config: " << (config_path.empty() ? "defaults" : config_path));

    statforge::runtime::Runtime runtime(config, args);
    if (!runtime.initialize(error))
    {
        LOG_ERROR("Initialization failed: " << error);
        if (args.role() == statforge::ipc::ProcessRole::FRONT_END)
        {
            std::cerr << "Use --help for usage information\n";
        }
        return statforge::client::kExitUsage;
    }

    return runtime.run();
}
