#pragma once

#include <QString>
#include <QVariant>

#include "garage_door_controller.h"
#include "light_controller.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::nomaiq {

inline constexpr char kManufacturer[] = "NOMA";

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
};

DeviceEntry buildLightEntry(const LightController &light, const Device &device);
DeviceEntry buildGarageDoorEntry(const GarageDoorController &door, const Device &device);

// Scalar payload of a channel write; invalid when the write has none.
QVariant requestScalar(const phicore::adapter::sdk::ChannelInvokeRequest &request);

} // namespace phicore::nomaiq
