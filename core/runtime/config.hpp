#pragma once

#include <cstdint>
#include <string>

namespace statforge {
namespace runtime {

// Children find the configuration through this variable, so the spawn
// command line stays limited to the role and endpoint flags.
constexpr const char *kConfigEnvVar = "STATFORGE_CONFIG";

constexpr const char *kDefaultCatalogUrl = "https://gib.me/sam/games.xml";

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct IpcConfig {
    int worker_timeout_ms = 30000;                      // Supervisor <-> worker exchange deadline
    int request_timeout_ms = -1;                        // Front end <-> supervisor deadline (-1 = none)
    int shutdown_timeout_ms = 2000;                     // Grace period before a child is killed
    uint64_t max_frame_bytes = 64ull * 1024ull * 1024;  // Largest accepted frame payload
};

struct CatalogConfig {
    std::string url = kDefaultCatalogUrl;
    std::string cache_path;  // Empty: <cache dir>/apps.xml
    int max_age_hours = 168;  // Cached list is refreshed after one week
};

struct SteamConfig {
    std::string library_path;  // libsteam_api.so; empty: search install locations
    std::string schema_dir;    // Directory holding UserGameStatsSchema_<id>.bin
    std::string language;      // Schema language; empty: ask the client
    uint32_t host_app_id = 480;  // App id the supervisor initialises under
    int stats_wait_ms = 2000;    // Worker wait for the user's stats after connecting
};

struct StatforgeConfig {
    LoggingConfig logging;
    IpcConfig ipc;
    CatalogConfig catalog;
    SteamConfig steam;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, StatforgeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const StatforgeConfig &config, std::string &error);

// APP_LIST_URL replaces catalog.url; APP_LIST_LOCAL names the cache file,
// relative to the cache directory unless absolute
void apply_env_overrides(StatforgeConfig &config);

// Command line value, then $STATFORGE_CONFIG, then the per-user default if it
// exists. Empty when none applies.
std::string resolve_config_path(const std::string &cli_path);

}  // namespace runtime
}  // namespace statforge
