#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace statforge {
namespace catalog {

enum class AppType { APP, MOD, DEMO, JUNK };

const char *app_type_to_string(AppType type);

// Case-insensitive: "app", "Mod", "DEMO", ...
std::optional<AppType> app_type_from_string(const std::string &name);

// One owned app as presented to the front end
struct AppModel {
    uint32_t app_id = 0;
    std::string app_name;
    std::optional<std::string> image_url;
    AppType app_type = AppType::APP;
    std::string developer = "Unknown";
    std::optional<uint8_t> metacritic_score;

    bool operator==(const AppModel &other) const;
};

std::ostream &operator<<(std::ostream &os, const AppModel &app);

void to_json(nlohmann::json &j, const AppType &type);
void from_json(const nlohmann::json &j, AppType &type);
void to_json(nlohmann::json &j, const AppModel &app);
void from_json(const nlohmann::json &j, AppModel &app);

}  // namespace catalog
}  // namespace statforge
