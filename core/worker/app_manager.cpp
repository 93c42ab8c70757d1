#include "app_manager.hpp"

#include "logging/logger.hpp"

namespace statforge {
namespace worker {

using ipc::ErrorKind;
using ipc::Response;

AppManager::AppManager(std::unique_ptr<native::IAppSession> session, std::string schema_path, std::string language)
    : session_(std::move(session)), schema_path_(std::move(schema_path)), language_(std::move(language)) {}

AppManager::~AppManager() { disconnect(); }

bool AppManager::prepare() {
    if (!session_->request_current_stats()) {
        LOG_ERROR("[AppManager] Client did not deliver the current stats for app " << app_id());
        return false;
    }
    return true;
}

bool AppManager::load_schema(stats::StatSchema &schema) {
    // Read on every request; the client may rewrite the file while we run
    std::string language = language_.empty() ? session_->current_language() : language_;
    std::string error;
    if (!stats::load_stat_schema(schema_path_, app_id(), language, schema, error)) {
        LOG_ERROR("[AppManager] " << error);
        return false;
    }
    return true;
}

Response<std::vector<stats::AchievementInfo>> AppManager::get_achievements() {
    using Result = Response<std::vector<stats::AchievementInfo>>;

    stats::StatSchema schema;
    if (!prepare() || !load_schema(schema)) {
        return Result::error(ErrorKind::UNKNOWN);
    }

    std::vector<stats::AchievementInfo> achievements;
    achievements.reserve(schema.achievements.size());
    for (const auto &def : schema.achievements) {
        bool achieved = false;
        uint32_t unlock_time = 0;
        if (!session_->get_achievement(def.id, achieved, unlock_time)) {
            LOG_DEBUG("[AppManager] No value for achievement " << def.id);
            continue;
        }

        stats::AchievementInfo info;
        info.id = def.id;
        info.is_achieved = achieved;
        if (achieved && unlock_time > 0) {
            info.unlock_time = unlock_time;
        }
        info.permission = def.permission;
        info.icon_normal = def.icon_normal;
        info.icon_locked = def.icon_locked;
        info.name = def.name;
        info.description = def.description;
        achievements.push_back(std::move(info));
    }
    return Result::success(std::move(achievements));
}

Response<std::vector<stats::StatInfo>> AppManager::get_stats() {
    using Result = Response<std::vector<stats::StatInfo>>;

    stats::StatSchema schema;
    if (!prepare() || !load_schema(schema)) {
        return Result::error(ErrorKind::UNKNOWN);
    }

    std::vector<stats::StatInfo> result;
    for (const auto &def : schema.integer_stats) {
        int32_t value = 0;
        if (!session_->get_stat_i32(def.id, value)) {
            LOG_DEBUG("[AppManager] No value for integer stat " << def.id);
            continue;
        }
        stats::IntStatInfo info;
        info.id = def.id;
        info.app_id = def.app_id;
        info.display_name = def.display_name;
        info.is_increment_only = def.increment_only;
        info.permission = def.permission;
        info.original_value = value;
        info.int_value = value;
        result.emplace_back(std::move(info));
    }
    for (const auto &def : schema.float_stats) {
        float value = 0.0f;
        if (!session_->get_stat_f32(def.id, value)) {
            LOG_DEBUG("[AppManager] No value for float stat " << def.id);
            continue;
        }
        stats::FloatStatInfo info;
        info.id = def.id;
        info.app_id = def.app_id;
        info.display_name = def.display_name;
        info.is_increment_only = def.increment_only;
        info.permission = def.permission;
        info.original_value = value;
        info.float_value = value;
        result.emplace_back(std::move(info));
    }
    return Result::success(std::move(result));
}

Response<bool> AppManager::set_achievement(const std::string &id, bool unlocked) {
    if (!prepare()) {
        return Response<bool>::error(ErrorKind::UNKNOWN);
    }

    bool written = unlocked ? session_->set_achievement(id) : session_->clear_achievement(id);
    if (!written) {
        LOG_WARN("[AppManager] Client refused to " << (unlocked ? "unlock" : "lock") << " achievement " << id);
        return Response<bool>::error(ErrorKind::UNKNOWN);
    }
    if (!session_->store_stats()) {
        LOG_WARN("[AppManager] Storing achievement " << id << " failed");
        return Response<bool>::error(ErrorKind::UNKNOWN);
    }
    LOG_INFO("[AppManager] Achievement " << id << (unlocked ? " unlocked" : " locked"));
    return Response<bool>::success(true);
}

Response<int32_t> AppManager::set_int_stat(const std::string &id, int32_t value) {
    if (!prepare()) {
        return Response<int32_t>::error(ErrorKind::UNKNOWN);
    }
    if (!session_->set_stat_i32(id, value) || !session_->store_stats()) {
        LOG_WARN("[AppManager] Cannot set integer stat " << id << " to " << value);
        return Response<int32_t>::error(ErrorKind::UNKNOWN);
    }

    int32_t stored = value;
    if (!session_->get_stat_i32(id, stored)) {
        LOG_WARN("[AppManager] Cannot read back integer stat " << id);
        return Response<int32_t>::error(ErrorKind::UNKNOWN);
    }
    LOG_INFO("[AppManager] Stat " << id << " = " << stored);
    return Response<int32_t>::success(stored);
}

Response<float> AppManager::set_float_stat(const std::string &id, float value) {
    if (!prepare()) {
        return Response<float>::error(ErrorKind::UNKNOWN);
    }
    if (!session_->set_stat_f32(id, value) || !session_->store_stats()) {
        LOG_WARN("[AppManager] Cannot set float stat " << id << " to " << value);
        return Response<float>::error(ErrorKind::UNKNOWN);
    }

    float stored = value;
    if (!session_->get_stat_f32(id, stored)) {
        LOG_WARN("[AppManager] Cannot read back float stat " << id);
        return Response<float>::error(ErrorKind::UNKNOWN);
    }
    LOG_INFO("[AppManager] Stat " << id << " = " << stored);
    return Response<float>::success(stored);
}

Response<bool> AppManager::reset_all_stats(bool include_achievements) {
    if (!prepare()) {
        return Response<bool>::error(ErrorKind::UNKNOWN);
    }
    bool reset = session_->reset_all_stats(include_achievements);
    LOG_INFO("[AppManager] Reset stats for app " << app_id() << (include_achievements ? " with achievements" : "")
                                                  << ": " << (reset ? "ok" : "refused"));
    return Response<bool>::success(reset);
}

void AppManager::disconnect() {
    if (session_) {
        session_->disconnect();
    }
}

}  // namespace worker
}  // namespace statforge
