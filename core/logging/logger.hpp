#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace statforge {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Process-wide logger. Every process of the tree (ui, supervisor, workers)
// writes to the stderr it inherited, so lines are tagged with the role.
class Logger {
public:
    static void init(Level threshold, const std::string& role);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();
    static const std::string& role();

private:
    static Level threshold_;
    static std::string role_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown names map to LVL_INFO
Level string_to_level(const std::string& level_str);
const char* level_tag(Level level);

} // namespace logging
} // namespace statforge

#define LOG_INTERNAL(lvl, msg) \
    do { \
        if ((lvl) >= statforge::logging::Logger::level()) { \
            std::stringstream ss; \
            ss << msg; \
            statforge::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(statforge::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(statforge::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(statforge::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(statforge::logging::Level::LVL_ERROR, msg)
