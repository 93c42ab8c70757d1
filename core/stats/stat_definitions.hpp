#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace statforge {
namespace stats {

// Bits returned by flags()
constexpr uint32_t kStatFlagNone = 0;
constexpr uint32_t kStatFlagIncrementOnly = 1u << 0;
constexpr uint32_t kStatFlagProtected = 1u << 1;
constexpr uint32_t kStatFlagUnknownPermission = 1u << 2;

// Permission bit marking a value that only a trusted server may change
constexpr int32_t kPermissionProtected = 2;

uint32_t permission_flags(bool increment_only, int32_t permission);

// Schema side: what the stats file says a stat or achievement is
struct AchievementDefinition {
    std::string id;
    uint32_t app_id = 0;
    std::string name;
    std::string description;
    std::string icon_normal;
    std::string icon_locked;
    bool is_hidden = false;
    int32_t permission = 0;
};

struct IntegerStatDefinition {
    std::string id;
    uint32_t app_id = 0;
    std::string display_name;
    int32_t permission = 0;
    int32_t min_value = 0;
    int32_t max_value = 0;
    int32_t max_change = 0;
    bool increment_only = false;
    bool set_by_trusted_game_server = false;
    int32_t default_value = 0;
};

struct FloatStatDefinition {
    std::string id;
    uint32_t app_id = 0;
    std::string display_name;
    int32_t permission = 0;
    float min_value = 0.0f;
    float max_value = 0.0f;
    float max_change = 0.0f;
    bool increment_only = false;
    float default_value = 0.0f;
};

// Runtime side: a definition joined with the client's current value

struct AchievementInfo {
    std::string id;
    bool is_achieved = false;
    std::optional<uint64_t> unlock_time;  // seconds since epoch
    int32_t permission = 0;
    std::string icon_normal;
    std::string icon_locked;
    std::string name;
    std::string description;
    std::optional<float> global_achieved_percent;

    bool operator==(const AchievementInfo &other) const;
};

struct IntStatInfo {
    std::string id;
    uint32_t app_id = 0;
    std::string display_name;
    bool is_increment_only = false;
    int32_t permission = 0;
    int32_t original_value = 0;
    int32_t int_value = 0;

    int32_t value() const { return int_value; }
    bool is_modified() const { return int_value != original_value; }
    uint32_t flags() const { return permission_flags(is_increment_only, permission); }

    // Protected stats refuse any change of value (sets error)
    bool set_value(int32_t value, std::string &error);
};

struct FloatStatInfo {
    std::string id;
    uint32_t app_id = 0;
    std::string display_name;
    bool is_increment_only = false;
    int32_t permission = 0;
    float original_value = 0.0f;
    float float_value = 0.0f;

    float value() const { return float_value; }
    bool is_modified() const { return float_value != original_value; }
    uint32_t flags() const { return permission_flags(is_increment_only, permission); }

    bool set_value(float value, std::string &error);
};

// An integer or float stat. Wire form: {"Integer":{...}} or {"Float":{...}}
class StatInfo {
public:
    StatInfo() : stat_(IntStatInfo()) {}
    StatInfo(IntStatInfo stat) : stat_(std::move(stat)) {}
    StatInfo(FloatStatInfo stat) : stat_(std::move(stat)) {}

    bool is_integer() const { return std::holds_alternative<IntStatInfo>(stat_); }
    bool is_float() const { return std::holds_alternative<FloatStatInfo>(stat_); }

    const IntStatInfo &as_integer() const { return std::get<IntStatInfo>(stat_); }
    const FloatStatInfo &as_float() const { return std::get<FloatStatInfo>(stat_); }

    const std::string &id() const;
    const std::string &display_name() const;
    int32_t permission() const;
    bool is_modified() const;
    uint32_t flags() const;

    // Current value formatted for display
    std::string value_string() const;

private:
    std::variant<IntStatInfo, FloatStatInfo> stat_;
};

void to_json(nlohmann::json &j, const AchievementInfo &info);
void from_json(const nlohmann::json &j, AchievementInfo &info);
void to_json(nlohmann::json &j, const IntStatInfo &info);
void from_json(const nlohmann::json &j, IntStatInfo &info);
void to_json(nlohmann::json &j, const FloatStatInfo &info);
void from_json(const nlohmann::json &j, FloatStatInfo &info);
void to_json(nlohmann::json &j, const StatInfo &info);
void from_json(const nlohmann::json &j, StatInfo &info);

}  // namespace stats
}  // namespace statforge
