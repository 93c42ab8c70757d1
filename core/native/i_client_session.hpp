#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace statforge {
namespace native {

// Supervisor-side connection to the client's catalog and ownership APIs
class IClientSession {
public:
    virtual ~IClientSession() = default;

    virtual bool is_subscribed(uint32_t app_id) = 0;
    virtual std::string current_language() = 0;

    // Display name, when the client exposes one
    virtual std::optional<std::string> app_name(uint32_t app_id) = 0;

    virtual void shutdown() = 0;
};

}  // namespace native
}  // namespace statforge
