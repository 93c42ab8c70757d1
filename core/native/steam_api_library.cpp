#include "steam_api_library.hpp"

#include <dlfcn.h>

#include <initializer_list>

#include "logging/logger.hpp"

namespace statforge {
namespace native {

namespace {

template <typename Fn>
Fn lookup(void *handle, const char *name) {
    return reinterpret_cast<Fn>(dlsym(handle, name));
}

// First of several versioned names that resolves
template <typename Fn>
Fn lookup_any(void *handle, std::initializer_list<const char *> names) {
    for (const char *name : names) {
        if (auto fn = lookup<Fn>(handle, name)) {
            LOG_DEBUG("[steam] Resolved " << name);
            return fn;
        }
    }
    return nullptr;
}

}  // namespace

SteamApiLibrary::~SteamApiLibrary() {
    shutdown();
    if (handle_ != nullptr) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

bool SteamApiLibrary::load(const std::string &configured_path, const std::vector<std::string> &candidates,
                           std::string &error) {
    if (handle_ != nullptr) {
        return true;
    }

    std::vector<std::string> paths;
    if (!configured_path.empty()) {
        paths.push_back(configured_path);
    }
    paths.insert(paths.end(), candidates.begin(), candidates.end());

    std::string last_dl_error = "no candidate paths";
    for (const auto &path : paths) {
        handle_ = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle_ != nullptr) {
            path_ = path;
            break;
        }
        const char *dl_error = dlerror();
        last_dl_error = dl_error ? dl_error : "unknown dlopen error";
        LOG_DEBUG("[steam] dlopen " << path << " failed: " << last_dl_error);
    }

    if (handle_ == nullptr) {
        error = "Cannot load libsteam_api: " + last_dl_error;
        return false;
    }

    LOG_DEBUG("[steam] Loaded " << path_);

    if (!resolve_symbols(error)) {
        dlclose(handle_);
        handle_ = nullptr;
        return false;
    }
    return true;
}

bool SteamApiLibrary::resolve_symbols(std::string &error) {
    SteamAPI_InitFlat = lookup<SteamAPI_InitFlat_pfn>(handle_, "SteamAPI_InitFlat");
    SteamAPI_Init = lookup<SteamAPI_Init_pfn>(handle_, "SteamAPI_Init");
    SteamAPI_Shutdown = lookup<SteamAPI_Shutdown_pfn>(handle_, "SteamAPI_Shutdown");
    SteamAPI_RunCallbacks = lookup<SteamAPI_RunCallbacks_pfn>(handle_, "SteamAPI_RunCallbacks");

    SteamUserStats =
        lookup_any<SteamUserStats_pfn>(handle_, {"SteamAPI_SteamUserStats_v013", "SteamAPI_SteamUserStats_v012"});
    SteamApps = lookup_any<SteamApps_pfn>(handle_, {"SteamAPI_SteamApps_v008"});
    SteamAppList = lookup_any<SteamAppList_pfn>(handle_, {"SteamAPI_SteamAppList_v001"});

    RequestCurrentStats = lookup<SteamAPI_ISteamUserStats_RequestCurrentStats_pfn>(
        handle_, "SteamAPI_ISteamUserStats_RequestCurrentStats");
    GetNumAchievements =
        lookup<SteamAPI_ISteamUserStats_GetNumAchievements_pfn>(handle_, "SteamAPI_ISteamUserStats_GetNumAchievements");
    GetAchievementAndUnlockTime = lookup<SteamAPI_ISteamUserStats_GetAchievementAndUnlockTime_pfn>(
        handle_, "SteamAPI_ISteamUserStats_GetAchievementAndUnlockTime");
    SetAchievement =
        lookup<SteamAPI_ISteamUserStats_SetAchievement_pfn>(handle_, "SteamAPI_ISteamUserStats_SetAchievement");
    ClearAchievement =
        lookup<SteamAPI_ISteamUserStats_ClearAchievement_pfn>(handle_, "SteamAPI_ISteamUserStats_ClearAchievement");
    GetStatInt32 = lookup<SteamAPI_ISteamUserStats_GetStatInt32_pfn>(handle_, "SteamAPI_ISteamUserStats_GetStatInt32");
    GetStatFloat = lookup<SteamAPI_ISteamUserStats_GetStatFloat_pfn>(handle_, "SteamAPI_ISteamUserStats_GetStatFloat");
    SetStatInt32 = lookup<SteamAPI_ISteamUserStats_SetStatInt32_pfn>(handle_, "SteamAPI_ISteamUserStats_SetStatInt32");
    SetStatFloat = lookup<SteamAPI_ISteamUserStats_SetStatFloat_pfn>(handle_, "SteamAPI_ISteamUserStats_SetStatFloat");
    StoreStats = lookup<SteamAPI_ISteamUserStats_StoreStats_pfn>(handle_, "SteamAPI_ISteamUserStats_StoreStats");
    ResetAllStats =
        lookup<SteamAPI_ISteamUserStats_ResetAllStats_pfn>(handle_, "SteamAPI_ISteamUserStats_ResetAllStats");

    BIsSubscribedApp =
        lookup<SteamAPI_ISteamApps_BIsSubscribedApp_pfn>(handle_, "SteamAPI_ISteamApps_BIsSubscribedApp");
    GetCurrentGameLanguage =
        lookup<SteamAPI_ISteamApps_GetCurrentGameLanguage_pfn>(handle_, "SteamAPI_ISteamApps_GetCurrentGameLanguage");

    GetAppName = lookup<SteamAPI_ISteamAppList_GetAppName_pfn>(handle_, "SteamAPI_ISteamAppList_GetAppName");

    struct Required {
        const char *name;
        bool present;
    };
    const Required required[] = {
        {"SteamAPI_Init", SteamAPI_Init != nullptr || SteamAPI_InitFlat != nullptr},
        {"SteamAPI_Shutdown", SteamAPI_Shutdown != nullptr},
        {"SteamAPI_RunCallbacks", SteamAPI_RunCallbacks != nullptr},
        {"SteamAPI_SteamUserStats", SteamUserStats != nullptr},
        {"SteamAPI_SteamApps", SteamApps != nullptr},
        {"GetNumAchievements", GetNumAchievements != nullptr},
        {"GetAchievementAndUnlockTime", GetAchievementAndUnlockTime != nullptr},
        {"SetAchievement", SetAchievement != nullptr},
        {"ClearAchievement", ClearAchievement != nullptr},
        {"GetStatInt32", GetStatInt32 != nullptr},
        {"GetStatFloat", GetStatFloat != nullptr},
        {"SetStatInt32", SetStatInt32 != nullptr},
        {"SetStatFloat", SetStatFloat != nullptr},
        {"StoreStats", StoreStats != nullptr},
        {"ResetAllStats", ResetAllStats != nullptr},
        {"BIsSubscribedApp", BIsSubscribedApp != nullptr},
        {"GetCurrentGameLanguage", GetCurrentGameLanguage != nullptr},
    };
    for (const auto &entry : required) {
        if (!entry.present) {
            error = std::string("libsteam_api is missing ") + entry.name + " (" + path_ + ")";
            return false;
        }
    }
    return true;
}

bool SteamApiLibrary::init(std::string &error) {
    if (initialized_) {
        return true;
    }
    if (handle_ == nullptr) {
        error = "libsteam_api not loaded";
        return false;
    }

    if (SteamAPI_InitFlat != nullptr) {
        char message[1024] = {0};
        int result = SteamAPI_InitFlat(message);
        if (result != 0) {
            error = "SteamAPI_InitFlat failed (" + std::to_string(result) + "): " + message;
            return false;
        }
    } else if (!SteamAPI_Init()) {
        error = "SteamAPI_Init failed (is the client running?)";
        return false;
    }

    user_stats_ = SteamUserStats();
    apps_ = SteamApps();
    app_list_ = (SteamAppList != nullptr && GetAppName != nullptr) ? SteamAppList() : nullptr;

    if (user_stats_ == nullptr || apps_ == nullptr) {
        SteamAPI_Shutdown();
        error = "Client did not provide the user stats or apps interface";
        return false;
    }

    initialized_ = true;
    return true;
}

void SteamApiLibrary::shutdown() {
    if (!initialized_) {
        return;
    }
    SteamAPI_Shutdown();
    initialized_ = false;
    user_stats_ = nullptr;
    apps_ = nullptr;
    app_list_ = nullptr;
}

void SteamApiLibrary::run_callbacks() const {
    if (initialized_) {
        SteamAPI_RunCallbacks();
    }
}

}  // namespace native
}  // namespace statforge
