#include "app_paths.hpp"

#include <limits.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "logging/logger.hpp"

namespace statforge {
namespace runtime {

namespace fs = std::filesystem;

namespace {

std::string env_or_empty(const char *name) {
    const char *value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

fs::path home_dir() {
    auto home = env_or_empty("HOME");
    if (home.empty()) {
        LOG_WARN("HOME not set, using /tmp");
        return "/tmp";
    }
    return home;
}

}  // namespace

bool self_executable_path(std::string &out, std::string &error) {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n < 0) {
        error = "Cannot resolve own executable: " + std::string(strerror(errno));
        return false;
    }
    buf[n] = '\0';
    out = buf;
    return true;
}

fs::path cache_dir() {
    fs::path dir;
    auto snap_common = env_or_empty("SNAP_USER_COMMON");
    auto xdg_cache = env_or_empty("XDG_CACHE_HOME");
    if (!snap_common.empty()) {
        dir = snap_common;
    } else if (!xdg_cache.empty()) {
        dir = fs::path(xdg_cache) / "statforge";
    } else {
        dir = home_dir() / ".cache" / "statforge";
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR("Failed to create cache dir " << dir.string() << ": " << ec.message());
        return "/tmp";
    }
    return dir;
}

fs::path config_dir() {
    auto xdg_config = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg_config.empty()) {
        return fs::path(xdg_config) / "statforge";
    }
    return home_dir() / ".config" / "statforge";
}

std::vector<fs::path> steam_install_candidates() {
    auto snap_home = env_or_empty("SNAP_REAL_HOME");
    if (!snap_home.empty()) {
        return {fs::path(snap_home) / "snap/steam/common/.local/share/Steam"};
    }
    auto home = home_dir();
    return {
        home / "snap/steam/common/.local/share/Steam",
        home / ".steam/debian-installation",
        home / ".steam/steam",
        home / ".steam/root",
        home / ".local/share/Steam",
    };
}

std::optional<fs::path> find_steam_install_dir() {
    std::error_code ec;
    for (const auto &dir : steam_install_candidates()) {
        if (fs::exists(dir, ec)) {
            return dir;
        }
    }
    return std::nullopt;
}

bool schema_file_path(const std::string &schema_dir, uint32_t app_id, fs::path &out, std::string &error) {
    const std::string file_name = "UserGameStatsSchema_" + std::to_string(app_id) + ".bin";
    if (!schema_dir.empty()) {
        out = fs::path(schema_dir) / file_name;
        return true;
    }
    auto install = find_steam_install_dir();
    if (!install) {
        error = "No Steam installation found";
        return false;
    }
    out = *install / "appcache" / "stats" / file_name;
    return true;
}

std::optional<fs::path> local_banner_path(uint32_t app_id) {
    auto install = find_steam_install_dir();
    if (!install) {
        return std::nullopt;
    }
    auto path = *install / "appcache" / "librarycache" / std::to_string(app_id) / "header.jpg";
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    return path;
}

std::vector<std::string> steam_api_library_candidates() {
    std::vector<std::string> candidates;

    std::string self, error;
    if (self_executable_path(self, error)) {
        candidates.push_back((fs::path(self).parent_path() / "libsteam_api.so").string());
    }
    // Bare name: resolved through LD_LIBRARY_PATH and the loader cache
    candidates.push_back("libsteam_api.so");
    return candidates;
}

}  // namespace runtime
}  // namespace statforge
