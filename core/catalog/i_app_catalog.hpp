#pragma once

#include <vector>

#include "app_model.hpp"
#include "ipc/protocol.hpp"
#include "native/i_client_session.hpp"

namespace statforge {
namespace catalog {

// Source of the apps the signed-in user owns
class IAppCatalog {
public:
    virtual ~IAppCatalog() = default;

    // Error(AppListRetrievalFailed) when the list cannot be obtained
    virtual ipc::Response<std::vector<AppModel>> owned_apps(native::IClientSession &session) = 0;
};

}  // namespace catalog
}  // namespace statforge
