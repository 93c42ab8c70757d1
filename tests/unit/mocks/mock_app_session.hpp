#pragma once
#include <gmock/gmock.h>

#include <string>

#include "native/i_app_session.hpp"

namespace statforge::tests {

class MockAppSession : public native::IAppSession {
public:
    MOCK_METHOD(uint32_t, app_id, (), (const, override));
    MOCK_METHOD(std::string, current_language, (), (override));
    MOCK_METHOD(bool, request_current_stats, (), (override));

    MOCK_METHOD(bool, get_achievement, (const std::string &, bool &, uint32_t &), (override));
    MOCK_METHOD(bool, set_achievement, (const std::string &), (override));
    MOCK_METHOD(bool, clear_achievement, (const std::string &), (override));

    MOCK_METHOD(bool, get_stat_i32, (const std::string &, int32_t &), (override));
    MOCK_METHOD(bool, get_stat_f32, (const std::string &, float &), (override));
    MOCK_METHOD(bool, set_stat_i32, (const std::string &, int32_t), (override));
    MOCK_METHOD(bool, set_stat_f32, (const std::string &, float), (override));

    MOCK_METHOD(bool, store_stats, (), (override));
    MOCK_METHOD(bool, reset_all_stats, (bool), (override));
    MOCK_METHOD(void, disconnect, (), (override));
};

}  // namespace statforge::tests
