#pragma once
#include <gmock/gmock.h>

#include <memory>
#include <string>

#include "native/i_session_factory.hpp"

namespace statforge::tests {

// gmock cannot return move-only types directly, so the mocked methods hand
// out raw pointers that the overrides wrap
class MockSessionFactory : public native::ISessionFactory {
public:
    MOCK_METHOD(native::IClientSession *, connect_client_raw, (std::string &));
    MOCK_METHOD(native::IAppSession *, connect_app_raw, (uint32_t, std::string &));

    std::unique_ptr<native::IClientSession> connect_client(std::string &error) override {
        return std::unique_ptr<native::IClientSession>(connect_client_raw(error));
    }

    std::unique_ptr<native::IAppSession> connect_app(uint32_t app_id, std::string &error) override {
        return std::unique_ptr<native::IAppSession>(connect_app_raw(app_id, error));
    }
};

}  // namespace statforge::tests
