#pragma once

#include <memory>
#include <optional>

#include <QList>
#include <QString>

#include "nomaiq_types.h"

namespace phicore::nomaiq {

// A cloud-side device as seen by the coordinator. Properties hold the last
// confirmed values read from the cloud; refresh() replaces them in place.
class Device
{
public:
    virtual ~Device() = default;

    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    const QString &serial() const noexcept { return m_serial; }
    const QString &name() const noexcept { return m_name; }
    const QString &oemModel() const noexcept { return m_oemModel; }

    bool hasProperty(const QString &name) const;
    std::optional<PropertyValue> property(const QString &name) const;
    const PropertyMap &properties() const noexcept { return m_properties; }

    // Carries the confirmed snapshot of a previous roster entry over to
    // this one when the device was not refreshed in the current tick.
    void adoptProperties(const Device &previous);

    virtual bool refresh(Failure *failure = nullptr) = 0;
    virtual bool setProperty(const QString &name, const PropertyValue &value, Failure *failure = nullptr) = 0;

protected:
    Device(QString serial, QString name, QString oemModel);

    void replaceProperties(PropertyMap properties);

private:
    QString m_serial;
    QString m_name;
    QString m_oemModel;
    PropertyMap m_properties;
};

using DevicePtr = std::shared_ptr<Device>;
using DeviceRoster = QList<DevicePtr>;

DevicePtr findDevice(const DeviceRoster &roster, const QString &serial);

bool isLightDevice(const Device &device);
bool isGarageDoorDevice(const Device &device);

} // namespace phicore::nomaiq
