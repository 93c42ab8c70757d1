#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "keyvalue/key_value.hpp"
#include "stat_definitions.hpp"

namespace statforge {
namespace stats {

// Values of the "type" / "type_int" field of a schema stat entry
enum class SchemaStatType : int32_t {
    INVALID = 0,
    INTEGER = 1,
    FLOAT = 2,
    AVERAGE_RATE = 3,
    ACHIEVEMENTS = 4,
    GROUP_ACHIEVEMENTS = 5
};

// Everything a UserGameStatsSchema file declares for one app, in file order
struct StatSchema {
    uint32_t app_id = 0;
    std::vector<AchievementDefinition> achievements;
    std::vector<IntegerStatDefinition> integer_stats;
    std::vector<FloatStatDefinition> float_stats;

    bool empty() const { return achievements.empty() && integer_stats.empty() && float_stats.empty(); }
};

/**
 * @brief Picks the display string of a localised schema node.
 *
 * Tries the child named after `language`, then "english", then the node's
 * own string value. Empty strings are skipped. Returns `fallback` when none
 * of them yields text.
 */
std::string localized_string(const keyvalue::KeyValue &node, const std::string &language,
                             const std::string &fallback);

// Builds the definitions from a decoded schema tree (<app_id>/stats/<n>/...).
// Fails when the tree has no stats section for the app.
bool parse_stat_schema(const keyvalue::KeyValue &root, uint32_t app_id, const std::string &language,
                       StatSchema &out, std::string &error);

// Decodes and parses a schema file
bool load_stat_schema(const std::string &path, uint32_t app_id, const std::string &language, StatSchema &out,
                      std::string &error);

}  // namespace stats
}  // namespace statforge
