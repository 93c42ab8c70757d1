#pragma once

#include <cstdint>
#include <string>

namespace statforge {
namespace native {

// Worker-side connection scoped to exactly one app id. Every call returns
// false when the client rejects it.
class IAppSession {
public:
    virtual ~IAppSession() = default;

    virtual uint32_t app_id() const = 0;
    virtual std::string current_language() = 0;

    // Loads the user's current values; must succeed before any get/set
    virtual bool request_current_stats() = 0;

    // unlock_time is seconds since epoch, 0 when locked
    virtual bool get_achievement(const std::string &id, bool &achieved, uint32_t &unlock_time) = 0;
    virtual bool set_achievement(const std::string &id) = 0;
    virtual bool clear_achievement(const std::string &id) = 0;

    virtual bool get_stat_i32(const std::string &id, int32_t &value) = 0;
    virtual bool get_stat_f32(const std::string &id, float &value) = 0;
    virtual bool set_stat_i32(const std::string &id, int32_t value) = 0;
    virtual bool set_stat_f32(const std::string &id, float value) = 0;

    // Commits pending changes to the client
    virtual bool store_stats() = 0;
    virtual bool reset_all_stats(bool achievements_too) = 0;

    virtual void disconnect() = 0;
};

}  // namespace native
}  // namespace statforge
