#pragma once

#include "nomaiq_device.h"
#include "nomaiq_types.h"

namespace phicore::nomaiq {

// Session plus device roster provider consumed by the update coordinator.
class DeviceSource
{
public:
    virtual ~DeviceSource() = default;

    // Fails with FailureKind::AuthExpiring when a refreshAuth() call is due,
    // with FailureKind::Auth when the session is unusable.
    virtual bool checkAuth(Failure *failure = nullptr) = 0;
    virtual bool refreshAuth(Failure *failure = nullptr) = 0;

    // Returns a fresh roster. Device properties may be empty until refreshed.
    virtual bool fetchDevices(DeviceRoster *devices, Failure *failure = nullptr) = 0;
};

} // namespace phicore::nomaiq
