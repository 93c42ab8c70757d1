#include "app_model.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace statforge {
namespace catalog {

const char *app_type_to_string(AppType type) {
    switch (type) {
        case AppType::APP:
            return "App";
        case AppType::MOD:
            return "Mod";
        case AppType::DEMO:
            return "Demo";
        case AppType::JUNK:
            return "Junk";
    }
    return "App";
}

std::optional<AppType> app_type_from_string(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "app") return AppType::APP;
    if (lower == "mod") return AppType::MOD;
    if (lower == "demo") return AppType::DEMO;
    if (lower == "junk") return AppType::JUNK;
    return std::nullopt;
}

bool AppModel::operator==(const AppModel &other) const {
    return app_id == other.app_id && app_name == other.app_name && image_url == other.image_url &&
           app_type == other.app_type && developer == other.developer && metacritic_score == other.metacritic_score;
}

std::ostream &operator<<(std::ostream &os, const AppModel &app) {
    return os << app.app_id << " " << app.app_name << " [" << app_type_to_string(app.app_type) << "]";
}

void to_json(nlohmann::json &j, const AppType &type) { j = app_type_to_string(type); }

void from_json(const nlohmann::json &j, AppType &type) {
    auto parsed = app_type_from_string(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown app type: " + j.get<std::string>());
    }
    type = *parsed;
}

void to_json(nlohmann::json &j, const AppModel &app) {
    j = nlohmann::json{{"app_id", app.app_id},
                       {"app_name", app.app_name},
                       {"image_url", nullptr},
                       {"app_type", app.app_type},
                       {"developer", app.developer},
                       {"metacritic_score", nullptr}};
    if (app.image_url) {
        j["image_url"] = *app.image_url;
    }
    if (app.metacritic_score) {
        j["metacritic_score"] = *app.metacritic_score;
    }
}

void from_json(const nlohmann::json &j, AppModel &app) {
    j.at("app_id").get_to(app.app_id);
    j.at("app_name").get_to(app.app_name);
    j.at("app_type").get_to(app.app_type);
    j.at("developer").get_to(app.developer);

    app.image_url.reset();
    if (j.contains("image_url") && !j["image_url"].is_null()) {
        app.image_url = j["image_url"].get<std::string>();
    }
    app.metacritic_score.reset();
    if (j.contains("metacritic_score") && !j["metacritic_score"].is_null()) {
        app.metacritic_score = j["metacritic_score"].get<uint8_t>();
    }
}

}  // namespace catalog
}  // namespace statforge
