#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "i_session_factory.hpp"
#include "steam_api_library.hpp"

namespace statforge {
namespace native {

// App id the supervisor initialises under; ownership queries work for any app
constexpr uint32_t kDefaultHostAppId = 480;

struct SteamSessionOptions {
    std::string library_path;  // empty: search the usual locations
    uint32_t host_app_id = kDefaultHostAppId;
    int stats_wait_ms = 2000;  // how long a worker waits for the user's stats
};

class SteamClientSession : public IClientSession {
public:
    explicit SteamClientSession(std::unique_ptr<SteamApiLibrary> library);
    ~SteamClientSession() override;

    bool is_subscribed(uint32_t app_id) override;
    std::string current_language() override;
    std::optional<std::string> app_name(uint32_t app_id) override;
    void shutdown() override;

private:
    std::unique_ptr<SteamApiLibrary> library_;
};

class SteamAppSession : public IAppSession {
public:
    SteamAppSession(uint32_t app_id, std::unique_ptr<SteamApiLibrary> library, int stats_wait_ms);
    ~SteamAppSession() override;

    uint32_t app_id() const override { return app_id_; }
    std::string current_language() override;

    bool request_current_stats() override;

    bool get_achievement(const std::string &id, bool &achieved, uint32_t &unlock_time) override;
    bool set_achievement(const std::string &id) override;
    bool clear_achievement(const std::string &id) override;

    bool get_stat_i32(const std::string &id, int32_t &value) override;
    bool get_stat_f32(const std::string &id, float &value) override;
    bool set_stat_i32(const std::string &id, int32_t value) override;
    bool set_stat_f32(const std::string &id, float value) override;

    bool store_stats() override;
    bool reset_all_stats(bool achievements_too) override;

    void disconnect() override;

private:
    bool connected() const { return library_ && library_->is_initialized(); }

    uint32_t app_id_;
    std::unique_ptr<SteamApiLibrary> library_;
    int stats_wait_ms_;
    bool stats_ready_ = false;
};

// Connects through libsteam_api. Each connection exports SteamAppId before
// SteamAPI_Init, so a process may hold only one session.
class SteamSessionFactory : public ISessionFactory {
public:
    explicit SteamSessionFactory(SteamSessionOptions options);

    std::unique_ptr<IClientSession> connect_client(std::string &error) override;
    std::unique_ptr<IAppSession> connect_app(uint32_t app_id, std::string &error) override;

private:
    std::unique_ptr<SteamApiLibrary> open_library(uint32_t app_id, std::string &error);

    SteamSessionOptions options_;
};

}  // namespace native
}  // namespace statforge
