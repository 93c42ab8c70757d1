#include "stat_schema.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <limits>

#include "logging/logger.hpp"

namespace statforge {
namespace stats {

using keyvalue::KeyValue;

namespace {

bool iequals(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Entries are keyed "0", "1", ... "10"; map order would put "10" before "2"
std::vector<const KeyValue *> ordered_children(const KeyValue &node) {
    std::vector<const KeyValue *> children;
    children.reserve(node.children().size());
    for (const auto &entry : node.children()) {
        children.push_back(&entry.second);
    }
    std::stable_sort(children.begin(), children.end(), [](const KeyValue *a, const KeyValue *b) {
        char *end_a = nullptr;
        char *end_b = nullptr;
        long index_a = std::strtol(a->name().c_str(), &end_a, 10);
        long index_b = std::strtol(b->name().c_str(), &end_b, 10);
        bool numeric_a = !a->name().empty() && *end_a == '\0';
        bool numeric_b = !b->name().empty() && *end_b == '\0';
        if (numeric_a && numeric_b) {
            return index_a < index_b;
        }
        if (numeric_a != numeric_b) {
            return numeric_a;
        }
        return a->name() < b->name();
    });
    return children;
}

SchemaStatType stat_type(const KeyValue &stat) {
    const KeyValue &type_int = stat["type_int"];
    int32_t raw = type_int.valid() ? type_int.as_i32(0) : stat["type"].as_i32(0);
    return static_cast<SchemaStatType>(raw);
}

IntegerStatDefinition parse_integer_stat(const KeyValue &stat, uint32_t app_id, const std::string &language) {
    IntegerStatDefinition def;
    def.id = stat["name"].as_string("");
    def.app_id = app_id;
    def.display_name = localized_string(stat["display"]["name"], language, def.id);
    def.min_value = stat["min"].as_i32(INT32_MIN);
    def.max_value = stat["max"].as_i32(INT32_MAX);
    def.max_change = stat["maxchange"].as_i32(0);
    def.increment_only = stat["incrementonly"].as_bool(false);
    def.set_by_trusted_game_server = stat["bSetByTrustedGS"].as_bool(false);
    def.default_value = stat["default"].as_i32(0);
    def.permission = stat["permission"].as_i32(0);
    return def;
}

FloatStatDefinition parse_float_stat(const KeyValue &stat, uint32_t app_id, const std::string &language) {
    FloatStatDefinition def;
    def.id = stat["name"].as_string("");
    def.app_id = app_id;
    def.display_name = localized_string(stat["display"]["name"], language, def.id);
    def.min_value = stat["min"].as_f32(std::numeric_limits<float>::lowest());
    def.max_value = stat["max"].as_f32(std::numeric_limits<float>::max());
    def.max_change = stat["maxchange"].as_f32(0.0f);
    def.increment_only = stat["incrementonly"].as_bool(false);
    def.default_value = stat["default"].as_f32(0.0f);
    def.permission = stat["permission"].as_i32(0);
    return def;
}

void parse_achievement_bits(const KeyValue &stat, uint32_t app_id, const std::string &language,
                            std::vector<AchievementDefinition> &out) {
    for (const KeyValue *bits : ordered_children(stat)) {
        if (!iequals(bits->name(), "bits") || !bits->valid()) {
            continue;
        }
        for (const KeyValue *bit : ordered_children(*bits)) {
            const KeyValue &display = (*bit)["display"];
            AchievementDefinition def;
            def.id = (*bit)["name"].as_string("");
            def.app_id = app_id;
            def.name = localized_string(display["name"], language, def.id);
            def.description = localized_string(display["desc"], language, "");
            def.icon_normal = display["icon"].as_string("");
            def.icon_locked = display["icon_gray"].as_string("");
            def.is_hidden = display["hidden"].as_bool(false);
            def.permission = (*bit)["permission"].as_i32(0);
            if (def.id.empty()) {
                LOG_DEBUG("[Schema] Skipping unnamed achievement bit " << bit->name());
                continue;
            }
            out.push_back(std::move(def));
        }
    }
}

}  // namespace

std::string localized_string(const KeyValue &node, const std::string &language, const std::string &fallback) {
    std::string text = node[language].as_string("");
    if (!text.empty()) {
        return text;
    }
    if (language != "english") {
        text = node["english"].as_string("");
        if (!text.empty()) {
            return text;
        }
    }
    text = node.as_string("");
    if (!text.empty()) {
        return text;
    }
    return fallback;
}

bool parse_stat_schema(const KeyValue &root, uint32_t app_id, const std::string &language, StatSchema &out,
                       std::string &error) {
    const KeyValue &stats = root[std::to_string(app_id)]["stats"];
    if (!stats.valid()) {
        error = "Schema has no stats section for app " + std::to_string(app_id);
        return false;
    }

    StatSchema schema;
    schema.app_id = app_id;

    for (const KeyValue *stat : ordered_children(stats)) {
        if (!stat->valid()) {
            continue;
        }
        SchemaStatType type = stat_type(*stat);
        switch (type) {
            case SchemaStatType::INVALID:
                break;
            case SchemaStatType::INTEGER:
                schema.integer_stats.push_back(parse_integer_stat(*stat, app_id, language));
                break;
            case SchemaStatType::FLOAT:
            case SchemaStatType::AVERAGE_RATE:
                schema.float_stats.push_back(parse_float_stat(*stat, app_id, language));
                break;
            case SchemaStatType::ACHIEVEMENTS:
            case SchemaStatType::GROUP_ACHIEVEMENTS:
                parse_achievement_bits(*stat, app_id, language, schema.achievements);
                break;
            default:
                LOG_WARN("[Schema] App " << app_id << ": skipping stat " << stat->name() << " of unknown type "
                                         << static_cast<int32_t>(type));
                break;
        }
    }

    LOG_DEBUG("[Schema] App " << app_id << ": " << schema.achievements.size() << " achievements, "
                              << schema.integer_stats.size() << " integer stats, " << schema.float_stats.size()
                              << " float stats");
    out = std::move(schema);
    return true;
}

bool load_stat_schema(const std::string &path, uint32_t app_id, const std::string &language, StatSchema &out,
                      std::string &error) {
    KeyValue root = KeyValue::root();
    keyvalue::KeyValueError kv_error;
    if (!KeyValue::load_binary(path, root, kv_error)) {
        error = "Cannot decode schema " + path + ": " + kv_error.to_string();
        return false;
    }
    return parse_stat_schema(root, app_id, language, out, error);
}

}  // namespace stats
}  // namespace statforge
