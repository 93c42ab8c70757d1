#include "steam_sessions.hpp"

#include <stdlib.h>

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "runtime/app_paths.hpp"

namespace statforge {
namespace native {

SteamClientSession::SteamClientSession(std::unique_ptr<SteamApiLibrary> library) : library_(std::move(library)) {}

SteamClientSession::~SteamClientSession() { shutdown(); }

bool SteamClientSession::is_subscribed(uint32_t app_id) {
    if (!library_ || !library_->is_initialized()) {
        return false;
    }
    return library_->BIsSubscribedApp(library_->apps(), app_id);
}

std::string SteamClientSession::current_language() {
    if (!library_ || !library_->is_initialized()) {
        return "english";
    }
    const char *language = library_->GetCurrentGameLanguage(library_->apps());
    return (language && *language) ? language : "english";
}

std::optional<std::string> SteamClientSession::app_name(uint32_t app_id) {
    if (!library_ || !library_->is_initialized() || library_->app_list() == nullptr) {
        return std::nullopt;
    }
    char name[256] = {0};
    int length = library_->GetAppName(library_->app_list(), app_id, name, sizeof(name));
    if (length <= 0) {
        return std::nullopt;
    }
    return std::string(name);
}

void SteamClientSession::shutdown() {
    if (library_ && library_->is_initialized()) {
        LOG_INFO("[steam] Closing client session");
        library_->shutdown();
    }
}

SteamAppSession::SteamAppSession(uint32_t app_id, std::unique_ptr<SteamApiLibrary> library, int stats_wait_ms)
    : app_id_(app_id), library_(std::move(library)), stats_wait_ms_(stats_wait_ms) {}

SteamAppSession::~SteamAppSession() { disconnect(); }

std::string SteamAppSession::current_language() {
    if (!connected()) {
        return "english";
    }
    const char *language = library_->GetCurrentGameLanguage(library_->apps());
    return (language && *language) ? language : "english";
}

bool SteamAppSession::request_current_stats() {
    if (!connected()) {
        return false;
    }
    if (stats_ready_) {
        return true;
    }

    // Newer SDKs load the stats on init and no longer export the request
    if (library_->RequestCurrentStats != nullptr && !library_->RequestCurrentStats(library_->user_stats())) {
        LOG_WARN("[steam] RequestCurrentStats rejected for app " << app_id_);
        return false;
    }

    // No callback registration here: pump callbacks until the schema shows up
    auto start = std::chrono::steady_clock::now();
    while (true) {
        library_->run_callbacks();
        if (library_->GetNumAchievements(library_->user_stats()) > 0) {
            break;
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= stats_wait_ms_) {
            // Apps without achievements never report any; their stats are usable anyway
            LOG_DEBUG("[steam] No achievements reported for app " << app_id_ << " after " << stats_wait_ms_ << "ms");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    stats_ready_ = true;
    return true;
}

bool SteamAppSession::get_achievement(const std::string &id, bool &achieved, uint32_t &unlock_time) {
    if (!connected()) return false;
    return library_->GetAchievementAndUnlockTime(library_->user_stats(), id.c_str(), &achieved, &unlock_time);
}

bool SteamAppSession::set_achievement(const std::string &id) {
    if (!connected()) return false;
    return library_->SetAchievement(library_->user_stats(), id.c_str());
}

bool SteamAppSession::clear_achievement(const std::string &id) {
    if (!connected()) return false;
    return library_->ClearAchievement(library_->user_stats(), id.c_str());
}

bool SteamAppSession::get_stat_i32(const std::string &id, int32_t &value) {
    if (!connected()) return false;
    return library_->GetStatInt32(library_->user_stats(), id.c_str(), &value);
}

bool SteamAppSession::get_stat_f32(const std::string &id, float &value) {
    if (!connected()) return false;
    return library_->GetStatFloat(library_->user_stats(), id.c_str(), &value);
}

bool SteamAppSession::set_stat_i32(const std::string &id, int32_t value) {
    if (!connected()) return false;
    return library_->SetStatInt32(library_->user_stats(), id.c_str(), value);
}

bool SteamAppSession::set_stat_f32(const std::string &id, float value) {
    if (!connected()) return false;
    return library_->SetStatFloat(library_->user_stats(), id.c_str(), value);
}

bool SteamAppSession::store_stats() {
    if (!connected()) return false;
    bool stored = library_->StoreStats(library_->user_stats());
    library_->run_callbacks();
    return stored;
}

bool SteamAppSession::reset_all_stats(bool achievements_too) {
    if (!connected()) return false;
    return library_->ResetAllStats(library_->user_stats(), achievements_too);
}

void SteamAppSession::disconnect() {
    if (connected()) {
        LOG_INFO("[steam] Disconnecting app " << app_id_);
        library_->shutdown();
    }
    stats_ready_ = false;
}

SteamSessionFactory::SteamSessionFactory(SteamSessionOptions options) : options_(std::move(options)) {}

std::unique_ptr<SteamApiLibrary> SteamSessionFactory::open_library(uint32_t app_id, std::string &error) {
    // The client scopes the session to the app named here
    if (setenv("SteamAppId", std::to_string(app_id).c_str(), 1) != 0 ||
        setenv("SteamGameId", std::to_string(app_id).c_str(), 1) != 0) {
        error = "Cannot export SteamAppId";
        return nullptr;
    }

    auto library = std::make_unique<SteamApiLibrary>();
    if (!library->load(options_.library_path, runtime::steam_api_library_candidates(), error)) {
        return nullptr;
    }
    if (!library->init(error)) {
        return nullptr;
    }
    LOG_INFO("[steam] Connected as app " << app_id << " via " << library->path());
    return library;
}

std::unique_ptr<IClientSession> SteamSessionFactory::connect_client(std::string &error) {
    auto library = open_library(options_.host_app_id, error);
    if (!library) {
        return nullptr;
    }
    return std::make_unique<SteamClientSession>(std::move(library));
}

std::unique_ptr<IAppSession> SteamSessionFactory::connect_app(uint32_t app_id, std::string &error) {
    auto library = open_library(app_id, error);
    if (!library) {
        return nullptr;
    }
    return std::make_unique<SteamAppSession>(app_id, std::move(library), options_.stats_wait_ms);
}

}  // namespace native
}  // namespace statforge
