#pragma once

#include <gmock/gmock.h>

#include "nomaiq_source.h"

namespace phicore::nomaiq::test {

class MockDeviceSource : public DeviceSource
{
public:
    MOCK_METHOD(bool, checkAuth, (Failure * failure), (override));
    MOCK_METHOD(bool, refreshAuth, (Failure * failure), (override));
    MOCK_METHOD(bool, fetchDevices, (DeviceRoster * devices, Failure *failure), (override));
};

} // namespace phicore::nomaiq::test
