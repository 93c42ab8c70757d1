#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ipc/protocol.hpp"
#include "native/i_app_session.hpp"
#include "stats/stat_definitions.hpp"
#include "stats/stat_schema.hpp"

namespace statforge {
namespace worker {

/**
 * @brief Reads and writes one app's achievements and stats.
 *
 * Joins the definitions of the app's schema file with the values the client
 * reports for the signed-in user. Every operation reports failure as an
 * ErrorKind; nothing here ends the worker.
 */
class AppManager {
public:
    // schema_path: UserGameStatsSchema_<app>.bin; language: empty asks the session
    AppManager(std::unique_ptr<native::IAppSession> session, std::string schema_path, std::string language);
    ~AppManager();

    uint32_t app_id() const { return session_->app_id(); }

    ipc::Response<std::vector<stats::AchievementInfo>> get_achievements();
    ipc::Response<std::vector<stats::StatInfo>> get_stats();

    ipc::Response<bool> set_achievement(const std::string &id, bool unlocked);

    // Success payload is the value read back after storing
    ipc::Response<int32_t> set_int_stat(const std::string &id, int32_t value);
    ipc::Response<float> set_float_stat(const std::string &id, float value);

    // Success payload is the reset call's own result
    ipc::Response<bool> reset_all_stats(bool include_achievements);

    void disconnect();

private:
    bool load_schema(stats::StatSchema &schema);
    bool prepare();

    std::unique_ptr<native::IAppSession> session_;
    std::string schema_path_;
    std::string language_;
};

}  // namespace worker
}  // namespace statforge
