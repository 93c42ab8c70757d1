#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace statforge {
namespace native {

// Opaque interface pointers handed out by the flat API
using ISteamUserStatsPtr = void *;
using ISteamAppsPtr = void *;
using ISteamAppListPtr = void *;

// Flat C API entry points, resolved from libsteam_api at run time
using SteamAPI_Init_pfn = bool (*)();
using SteamAPI_InitFlat_pfn = int (*)(char *err_msg);
using SteamAPI_Shutdown_pfn = void (*)();
using SteamAPI_RunCallbacks_pfn = void (*)();

using SteamUserStats_pfn = ISteamUserStatsPtr (*)();
using SteamApps_pfn = ISteamAppsPtr (*)();
using SteamAppList_pfn = ISteamAppListPtr (*)();

using SteamAPI_ISteamUserStats_RequestCurrentStats_pfn = bool (*)(ISteamUserStatsPtr);
using SteamAPI_ISteamUserStats_GetNumAchievements_pfn = uint32_t (*)(ISteamUserStatsPtr);
using SteamAPI_ISteamUserStats_GetAchievementAndUnlockTime_pfn = bool (*)(ISteamUserStatsPtr, const char *, bool *,
                                                                         uint32_t *);
using SteamAPI_ISteamUserStats_SetAchievement_pfn = bool (*)(ISteamUserStatsPtr, const char *);
using SteamAPI_ISteamUserStats_ClearAchievement_pfn = bool (*)(ISteamUserStatsPtr, const char *);
using SteamAPI_ISteamUserStats_GetStatInt32_pfn = bool (*)(ISteamUserStatsPtr, const char *, int32_t *);
using SteamAPI_ISteamUserStats_GetStatFloat_pfn = bool (*)(ISteamUserStatsPtr, const char *, float *);
using SteamAPI_ISteamUserStats_SetStatInt32_pfn = bool (*)(ISteamUserStatsPtr, const char *, int32_t);
using SteamAPI_ISteamUserStats_SetStatFloat_pfn = bool (*)(ISteamUserStatsPtr, const char *, float);
using SteamAPI_ISteamUserStats_StoreStats_pfn = bool (*)(ISteamUserStatsPtr);
using SteamAPI_ISteamUserStats_ResetAllStats_pfn = bool (*)(ISteamUserStatsPtr, bool);

using SteamAPI_ISteamApps_BIsSubscribedApp_pfn = bool (*)(ISteamAppsPtr, uint32_t);
using SteamAPI_ISteamApps_GetCurrentGameLanguage_pfn = const char *(*)(ISteamAppsPtr);

using SteamAPI_ISteamAppList_GetAppName_pfn = int (*)(ISteamAppListPtr, uint32_t, char *, int);

/**
 * @brief libsteam_api loaded with dlopen, plus the entry points statforge uses.
 *
 * Required symbols must all resolve for load() to succeed. Optional ones
 * (RequestCurrentStats, the app list interface) are left null when the SDK
 * build does not export them.
 *
 * The library keeps global state: at most one instance may be initialised
 * per process.
 */
class SteamApiLibrary {
public:
    SteamApiLibrary() = default;
    ~SteamApiLibrary();

    SteamApiLibrary(const SteamApiLibrary &) = delete;
    SteamApiLibrary &operator=(const SteamApiLibrary &) = delete;

    // Tries `configured_path` if set, then each candidate in order
    bool load(const std::string &configured_path, const std::vector<std::string> &candidates, std::string &error);

    // SteamAPI_Init against the running client. The app id is taken from
    // the SteamAppId environment variable.
    bool init(std::string &error);
    void shutdown();

    bool is_loaded() const { return handle_ != nullptr; }
    bool is_initialized() const { return initialized_; }
    const std::string &path() const { return path_; }

    void run_callbacks() const;

    ISteamUserStatsPtr user_stats() const { return user_stats_; }
    ISteamAppsPtr apps() const { return apps_; }
    ISteamAppListPtr app_list() const { return app_list_; }

    // Lifecycle
    SteamAPI_Init_pfn SteamAPI_Init = nullptr;
    SteamAPI_InitFlat_pfn SteamAPI_InitFlat = nullptr;
    SteamAPI_Shutdown_pfn SteamAPI_Shutdown = nullptr;
    SteamAPI_RunCallbacks_pfn SteamAPI_RunCallbacks = nullptr;

    // Interface accessors
    SteamUserStats_pfn SteamUserStats = nullptr;
    SteamApps_pfn SteamApps = nullptr;
    SteamAppList_pfn SteamAppList = nullptr;

    // ISteamUserStats
    SteamAPI_ISteamUserStats_RequestCurrentStats_pfn RequestCurrentStats = nullptr;
    SteamAPI_ISteamUserStats_GetNumAchievements_pfn GetNumAchievements = nullptr;
    SteamAPI_ISteamUserStats_GetAchievementAndUnlockTime_pfn GetAchievementAndUnlockTime = nullptr;
    SteamAPI_ISteamUserStats_SetAchievement_pfn SetAchievement = nullptr;
    SteamAPI_ISteamUserStats_ClearAchievement_pfn ClearAchievement = nullptr;
    SteamAPI_ISteamUserStats_GetStatInt32_pfn GetStatInt32 = nullptr;
    SteamAPI_ISteamUserStats_GetStatFloat_pfn GetStatFloat = nullptr;
    SteamAPI_ISteamUserStats_SetStatInt32_pfn SetStatInt32 = nullptr;
    SteamAPI_ISteamUserStats_SetStatFloat_pfn SetStatFloat = nullptr;
    SteamAPI_ISteamUserStats_StoreStats_pfn StoreStats = nullptr;
    SteamAPI_ISteamUserStats_ResetAllStats_pfn ResetAllStats = nullptr;

    // ISteamApps
    SteamAPI_ISteamApps_BIsSubscribedApp_pfn BIsSubscribedApp = nullptr;
    SteamAPI_ISteamApps_GetCurrentGameLanguage_pfn GetCurrentGameLanguage = nullptr;

    // ISteamAppList
    SteamAPI_ISteamAppList_GetAppName_pfn GetAppName = nullptr;

private:
    bool resolve_symbols(std::string &error);

    void *handle_ = nullptr;
    std::string path_;
    bool initialized_ = false;

    ISteamUserStatsPtr user_stats_ = nullptr;
    ISteamAppsPtr apps_ = nullptr;
    ISteamAppListPtr app_list_ = nullptr;
};

}  // namespace native
}  // namespace statforge
