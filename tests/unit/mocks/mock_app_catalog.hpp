#pragma once
#include <gmock/gmock.h>

#include <vector>

#include "catalog/i_app_catalog.hpp"

namespace statforge::tests {

class MockAppCatalog : public catalog::IAppCatalog {
public:
    MOCK_METHOD(ipc::Response<std::vector<catalog::AppModel>>, owned_apps, (native::IClientSession &), (override));
};

}  // namespace statforge::tests
