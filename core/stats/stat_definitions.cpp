#include "stat_definitions.hpp"

#include <sstream>

namespace statforge {
namespace stats {

using nlohmann::json;

uint32_t permission_flags(bool increment_only, int32_t permission) {
    uint32_t flags = kStatFlagNone;
    if (increment_only) {
        flags |= kStatFlagIncrementOnly;
    }
    if ((permission & kPermissionProtected) != 0) {
        flags |= kStatFlagProtected;
    }
    if ((permission & ~kPermissionProtected) != 0) {
        flags |= kStatFlagUnknownPermission;
    }
    return flags;
}

bool AchievementInfo::operator==(const AchievementInfo &other) const {
    return id == other.id && is_achieved == other.is_achieved && unlock_time == other.unlock_time &&
           permission == other.permission && icon_normal == other.icon_normal && icon_locked == other.icon_locked &&
           name == other.name && description == other.description &&
           global_achieved_percent == other.global_achieved_percent;
}

bool IntStatInfo::set_value(int32_t value, std::string &error) {
    if ((permission & kPermissionProtected) != 0 && int_value != value) {
        error = "Stat is protected";
        return false;
    }
    int_value = value;
    return true;
}

bool FloatStatInfo::set_value(float value, std::string &error) {
    if ((permission & kPermissionProtected) != 0 && float_value != value) {
        error = "Stat is protected";
        return false;
    }
    float_value = value;
    return true;
}

const std::string &StatInfo::id() const { return is_integer() ? as_integer().id : as_float().id; }

const std::string &StatInfo::display_name() const {
    return is_integer() ? as_integer().display_name : as_float().display_name;
}

int32_t StatInfo::permission() const { return is_integer() ? as_integer().permission : as_float().permission; }

bool StatInfo::is_modified() const { return is_integer() ? as_integer().is_modified() : as_float().is_modified(); }

uint32_t StatInfo::flags() const { return is_integer() ? as_integer().flags() : as_float().flags(); }

std::string StatInfo::value_string() const {
    if (is_integer()) {
        return std::to_string(as_integer().int_value);
    }
    std::ostringstream oss;
    oss << as_float().float_value;
    return oss.str();
}

// Optional fields are written as null and read back from null or absence

void to_json(json &j, const AchievementInfo &info) {
    j = json{{"id", info.id},
             {"is_achieved", info.is_achieved},
             {"unlock_time", info.unlock_time ? json(*info.unlock_time) : json(nullptr)},
             {"permission", info.permission},
             {"icon_normal", info.icon_normal},
             {"icon_locked", info.icon_locked},
             {"name", info.name},
             {"description", info.description},
             {"global_achieved_percent",
              info.global_achieved_percent ? json(*info.global_achieved_percent) : json(nullptr)}};
}

void from_json(const json &j, AchievementInfo &info) {
    j.at("id").get_to(info.id);
    j.at("is_achieved").get_to(info.is_achieved);
    info.unlock_time.reset();
    if (j.contains("unlock_time") && !j.at("unlock_time").is_null()) {
        info.unlock_time = j.at("unlock_time").get<uint64_t>();
    }
    j.at("permission").get_to(info.permission);
    j.at("icon_normal").get_to(info.icon_normal);
    j.at("icon_locked").get_to(info.icon_locked);
    j.at("name").get_to(info.name);
    j.at("description").get_to(info.description);
    info.global_achieved_percent.reset();
    if (j.contains("global_achieved_percent") && !j.at("global_achieved_percent").is_null()) {
        info.global_achieved_percent = j.at("global_achieved_percent").get<float>();
    }
}

void to_json(json &j, const IntStatInfo &info) {
    j = json{{"id", info.id},
             {"app_id", info.app_id},
             {"display_name", info.display_name},
             {"is_increment_only", info.is_increment_only},
             {"permission", info.permission},
             {"original_value", info.original_value},
             {"int_value", info.int_value}};
}

void from_json(const json &j, IntStatInfo &info) {
    j.at("id").get_to(info.id);
    j.at("app_id").get_to(info.app_id);
    j.at("display_name").get_to(info.display_name);
    j.at("is_increment_only").get_to(info.is_increment_only);
    j.at("permission").get_to(info.permission);
    j.at("original_value").get_to(info.original_value);
    j.at("int_value").get_to(info.int_value);
}

void to_json(json &j, const FloatStatInfo &info) {
    j = json{{"id", info.id},
             {"app_id", info.app_id},
             {"display_name", info.display_name},
             {"is_increment_only", info.is_increment_only},
             {"permission", info.permission},
             {"original_value", info.original_value},
             {"float_value", info.float_value}};
}

void from_json(const json &j, FloatStatInfo &info) {
    j.at("id").get_to(info.id);
    j.at("app_id").get_to(info.app_id);
    j.at("display_name").get_to(info.display_name);
    j.at("is_increment_only").get_to(info.is_increment_only);
    j.at("permission").get_to(info.permission);
    j.at("original_value").get_to(info.original_value);
    j.at("float_value").get_to(info.float_value);
}

void to_json(json &j, const StatInfo &info) {
    if (info.is_integer()) {
        j = json{{"Integer", info.as_integer()}};
    } else {
        j = json{{"Float", info.as_float()}};
    }
}

void from_json(const json &j, StatInfo &info) {
    // at() throws json::out_of_range when neither tag is present
    if (j.contains("Float")) {
        info = StatInfo(j.at("Float").get<FloatStatInfo>());
    } else {
        info = StatInfo(j.at("Integer").get<IntStatInfo>());
    }
}

}  // namespace stats
}  // namespace statforge
