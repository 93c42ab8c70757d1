#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#include "app_paths.hpp"
#include "logging/logger.hpp"

namespace statforge {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

}  // namespace

bool validate_config(const StatforgeConfig &config, std::string &error) {
    // Validate Logging settings
    const auto &level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error" && level != "none") {
        error = "Invalid log level: " + level;
        return false;
    }

    // Validate IPC settings
    if (config.ipc.worker_timeout_ms != -1 && config.ipc.worker_timeout_ms < 100) {
        error = "ipc.worker_timeout_ms must be -1 or >= 100ms";
        return false;
    }
    if (config.ipc.request_timeout_ms != -1 && config.ipc.request_timeout_ms < 100) {
        error = "ipc.request_timeout_ms must be -1 or >= 100ms";
        return false;
    }
    if (config.ipc.shutdown_timeout_ms < 100 || config.ipc.shutdown_timeout_ms > 30000) {
        error = "ipc.shutdown_timeout_ms must be between 100 and 30000ms";
        return false;
    }
    if (config.ipc.max_frame_bytes < 1024) {
        error = "ipc.max_frame_bytes must be >= 1024";
        return false;
    }

    // Validate Catalog settings
    if (config.catalog.url.empty()) {
        error = "catalog.url must not be empty";
        return false;
    }
    if (config.catalog.max_age_hours < 0) {
        error = "catalog.max_age_hours must be >= 0";
        return false;
    }

    // Validate Steam settings
    if (config.steam.host_app_id == 0) {
        error = "steam.host_app_id must be a non-zero app id";
        return false;
    }
    if (config.steam.stats_wait_ms < 0) {
        error = "steam.stats_wait_ms must be >= 0";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, StatforgeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: keep defaults
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"logging", "ipc", "catalog", "steam"});

        // Load logging config
        if (yaml["logging"]) {
            const auto &logging = yaml["logging"];
            warn_unknown_keys(logging, "logging", {"level"});
            if (logging["level"]) {
                config.logging.level = logging["level"].as<std::string>();
            }
        }

        // Load IPC config
        if (yaml["ipc"]) {
            const auto &ipc = yaml["ipc"];
            warn_unknown_keys(ipc, "ipc",
                              {"worker_timeout_ms", "request_timeout_ms", "shutdown_timeout_ms", "max_frame_bytes"});
            if (ipc["worker_timeout_ms"]) {
                config.ipc.worker_timeout_ms = ipc["worker_timeout_ms"].as<int>();
            }
            if (ipc["request_timeout_ms"]) {
                config.ipc.request_timeout_ms = ipc["request_timeout_ms"].as<int>();
            }
            if (ipc["shutdown_timeout_ms"]) {
                config.ipc.shutdown_timeout_ms = ipc["shutdown_timeout_ms"].as<int>();
            }
            if (ipc["max_frame_bytes"]) {
                config.ipc.max_frame_bytes = ipc["max_frame_bytes"].as<uint64_t>();
            }
        }

        // Load catalog config
        if (yaml["catalog"]) {
            const auto &catalog = yaml["catalog"];
            warn_unknown_keys(catalog, "catalog", {"url", "cache_path", "max_age_hours"});
            if (catalog["url"]) {
                config.catalog.url = catalog["url"].as<std::string>();
            }
            if (catalog["cache_path"]) {
                config.catalog.cache_path = catalog["cache_path"].as<std::string>();
            }
            if (catalog["max_age_hours"]) {
                config.catalog.max_age_hours = catalog["max_age_hours"].as<int>();
            }
        }

        // Load steam config
        if (yaml["steam"]) {
            const auto &steam = yaml["steam"];
            warn_unknown_keys(steam, "steam",
                              {"library_path", "schema_dir", "language", "host_app_id", "stats_wait_ms"});
            if (steam["library_path"]) {
                config.steam.library_path = steam["library_path"].as<std::string>();
            }
            if (steam["schema_dir"]) {
                config.steam.schema_dir = steam["schema_dir"].as<std::string>();
            }
            if (steam["language"]) {
                config.steam.language = steam["language"].as<std::string>();
            }
            if (steam["host_app_id"]) {
                config.steam.host_app_id = steam["host_app_id"].as<uint32_t>();
            }
            if (steam["stats_wait_ms"]) {
                config.steam.stats_wait_ms = steam["stats_wait_ms"].as<int>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_DEBUG("[Config] Log level: " << config.logging.level);
        LOG_DEBUG("[Config] Worker timeout: " << config.ipc.worker_timeout_ms << "ms");
        LOG_DEBUG("[Config] Catalog: " << config.catalog.url << " (max age " << config.catalog.max_age_hours << "h)");

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

void apply_env_overrides(StatforgeConfig &config) {
    if (const char *url = std::getenv("APP_LIST_URL")) {
        if (*url != '\0') {
            config.catalog.url = url;
        }
    }
    if (const char *local = std::getenv("APP_LIST_LOCAL")) {
        if (*local != '\0') {
            std::filesystem::path path(local);
            config.catalog.cache_path =
                path.is_absolute() ? path.string() : (cache_dir() / path.relative_path()).string();
        }
    }
}

std::string resolve_config_path(const std::string &cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    if (const char *env = std::getenv(kConfigEnvVar)) {
        if (*env != '\0') {
            return env;
        }
    }
    std::error_code ec;
    auto user_default = config_dir() / "statforge.yaml";
    if (std::filesystem::exists(user_default, ec)) {
        return user_default.string();
    }
    return "";
}

}  // namespace runtime
}  // namespace statforge
