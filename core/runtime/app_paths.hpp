#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace statforge {
namespace runtime {

// Absolute path of the running executable (used to re-invoke it as a child)
bool self_executable_path(std::string &out, std::string &error);

// Per-user cache directory, created on demand. Falls back to /tmp.
std::filesystem::path cache_dir();

// Per-user configuration directory ($XDG_CONFIG_HOME/statforge)
std::filesystem::path config_dir();

// Known Steam installation roots for the current user, most specific first
std::vector<std::filesystem::path> steam_install_candidates();

// First existing Steam installation root
std::optional<std::filesystem::path> find_steam_install_dir();

// Location of UserGameStatsSchema_<app_id>.bin. An empty schema_dir means the
// appcache of the detected Steam installation.
bool schema_file_path(const std::string &schema_dir, uint32_t app_id, std::filesystem::path &out, std::string &error);

// Cached header image of an app inside the Steam installation, if present
std::optional<std::filesystem::path> local_banner_path(uint32_t app_id);

// Places to look for libsteam_api.so when none is configured
std::vector<std::string> steam_api_library_candidates();

}  // namespace runtime
}  // namespace statforge
