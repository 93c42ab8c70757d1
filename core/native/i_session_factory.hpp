#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "i_app_session.hpp"
#include "i_client_session.hpp"

namespace statforge {
namespace native {

// Opens connections to the native client. Returns nullptr on failure (sets error).
class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;

    virtual std::unique_ptr<IClientSession> connect_client(std::string &error) = 0;
    virtual std::unique_ptr<IAppSession> connect_app(uint32_t app_id, std::string &error) = 0;
};

}  // namespace native
}  // namespace statforge
