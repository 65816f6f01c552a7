#include "nomaiq_device.h"

#include <utility>

namespace phicore::nomaiq {

Device::Device(QString serial, QString name, QString oemModel)
    : m_serial(std::move(serial))
    , m_name(std::move(name))
    , m_oemModel(std::move(oemModel))
{
}

bool Device::hasProperty(const QString &name) const
{
    return m_properties.contains(name);
}

std::optional<PropertyValue> Device::property(const QString &name) const
{
    const auto it = m_properties.constFind(name);
    if (it == m_properties.cend())
        return std::nullopt;
    return it.value();
}

void Device::adoptProperties(const Device &previous)
{
    if (&previous == this)
        return;
    m_properties = previous.m_properties;
}

void Device::replaceProperties(PropertyMap properties)
{
    m_properties = std::move(properties);
}

DevicePtr findDevice(const DeviceRoster &roster, const QString &serial)
{
    for (const DevicePtr &device : roster) {
        if (device && device->serial() == serial)
            return device;
    }
    return {};
}

bool isLightDevice(const Device &device)
{
    return device.hasProperty(QLatin1String(props::kPower))
        && device.hasProperty(QLatin1String(props::kVoiceData));
}

bool isGarageDoorDevice(const Device &device)
{
    return device.oemModel() == QLatin1String("gdo");
}

} // namespace phicore::nomaiq
