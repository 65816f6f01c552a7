#include "nomaiq_model.h"

#include <optional>
#include <utility>

#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::nomaiq {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

v1::Device makeDevice(const Device &device, const QString &name, v1::DeviceClass deviceClass,
                      const QString &uniqueId)
{
    v1::Device out;
    out.externalId = device.serial().toStdString();
    out.name = name.toStdString();
    out.manufacturer = kManufacturer;
    out.model = (device.oemModel().isEmpty() ? device.name() : device.oemModel()).toStdString();
    out.deviceClass = deviceClass;

    QJsonObject meta;
    meta.insert(QStringLiteral("uniqueId"), uniqueId);
    meta.insert(QStringLiteral("productName"), device.name());
    out.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();
    return out;
}

v1::Channel makeOnChannel(std::optional<bool> value)
{
    v1::Channel channel;
    channel.externalId = "on";
    channel.name = "Power";
    channel.kind = v1::ChannelKind::PowerOnOff;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultWrite;
    if (value.has_value()) {
        channel.hasValue = true;
        channel.lastValue = *value;
    }
    return channel;
}

// phi-core brightness is a percentage; the light surface works in 0..255.
v1::Channel makeBrightnessChannel(std::optional<int> exposed)
{
    v1::Channel channel;
    channel.externalId = "bri";
    channel.name = "Brightness";
    channel.kind = v1::ChannelKind::Brightness;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.minValue = 0.0;
    channel.maxValue = 100.0;
    channel.stepValue = 1.0;
    if (exposed.has_value()) {
        channel.hasValue = true;
        channel.lastValue = static_cast<double>(brightnessFromExposed(*exposed));
    }
    return channel;
}

v1::Channel makeCtChannel(std::optional<int> mired)
{
    v1::Channel channel;
    channel.externalId = "ct";
    channel.name = "Color temperature";
    channel.kind = v1::ChannelKind::ColorTemperature;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.unit = "mired";
    channel.minValue = kMinMired;
    channel.maxValue = kMaxMired;
    channel.stepValue = 1.0;
    if (mired.has_value()) {
        channel.hasValue = true;
        channel.lastValue = static_cast<std::int64_t>(*mired);
    }
    return channel;
}

v1::Channel makeIntChannel(const char *externalId, const char *name, const char *unit, int maxValue,
                           std::optional<double> value)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.unit = unit;
    channel.minValue = 0.0;
    channel.maxValue = maxValue;
    channel.stepValue = 1.0;
    if (value.has_value()) {
        channel.hasValue = true;
        channel.lastValue = static_cast<std::int64_t>(*value);
    }
    return channel;
}

v1::Channel makeDoorStatusChannel(const std::optional<QString> &status)
{
    v1::Channel channel;
    channel.externalId = "door_status";
    channel.name = "Door status";
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::String;
    channel.flags = v1::kChannelFlagDefaultRead;
    for (const char *value : {"opened", "closed", "opening", "closing"}) {
        v1::AdapterConfigOption option;
        option.value = value;
        option.label = value;
        channel.choices.push_back(std::move(option));
    }
    if (status.has_value()) {
        channel.hasValue = true;
        channel.lastValue = status->toStdString();
    }
    return channel;
}

v1::Channel makeClosedChannel(const std::optional<QString> &status, bool closed)
{
    v1::Channel channel;
    channel.externalId = "closed";
    channel.name = "Closed";
    channel.kind = v1::ChannelKind::Contact;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultRead;
    if (status.has_value()) {
        channel.hasValue = true;
        channel.lastValue = closed;
    }
    return channel;
}

v1::Channel makeDoorCommandChannel()
{
    v1::Channel channel;
    channel.externalId = "door_command";
    channel.name = "Door command";
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::String;
    channel.flags = v1::kChannelFlagDefaultWrite;
    const std::pair<const char *, const char *> commands[] = {
        {"open", "Open"},
        {"close", "Close"},
        {"stop", "Stop"},
    };
    for (const auto &command : commands) {
        v1::AdapterConfigOption option;
        option.value = command.first;
        option.label = command.second;
        channel.choices.push_back(std::move(option));
    }
    return channel;
}

} // namespace

DeviceEntry buildLightEntry(const LightController &light, const Device &device)
{
    DeviceEntry entry;
    entry.device = makeDevice(device, light.name(), v1::DeviceClass::Light, light.uniqueId());

    entry.channels.push_back(makeOnChannel(light.isOn()));
    entry.channels.push_back(makeBrightnessChannel(light.brightness()));

    if (light.isWhiteCapable() || light.isColorCapable())
        entry.channels.push_back(makeCtChannel(light.colorTempMired()));

    if (light.isColorCapable()) {
        const std::optional<HsColor> hs = light.hsColor();
        entry.channels.push_back(makeIntChannel("hue", "Hue", "deg", 359,
                                                hs ? std::optional<double>(hs->hue) : std::nullopt));
        entry.channels.push_back(makeIntChannel("sat", "Saturation", "%", 100,
                                                hs ? std::optional<double>(hs->saturation) : std::nullopt));
    }
    return entry;
}

DeviceEntry buildGarageDoorEntry(const GarageDoorController &door, const Device &device)
{
    DeviceEntry entry;
    entry.device = makeDevice(device, door.name(), v1::DeviceClass::Cover, door.uniqueId());

    const std::optional<QString> status = door.doorStatus();
    entry.channels.push_back(makeDoorStatusChannel(status));
    entry.channels.push_back(makeClosedChannel(status, door.isClosed()));
    entry.channels.push_back(makeDoorCommandChannel());
    return entry;
}

QVariant requestScalar(const sdk::ChannelInvokeRequest &request)
{
    if (!request.hasScalarValue)
        return QVariant();
    if (const auto *b = std::get_if<bool>(&request.value))
        return QVariant(*b);
    if (const auto *i = std::get_if<std::int64_t>(&request.value))
        return QVariant(qint64(*i));
    if (const auto *d = std::get_if<double>(&request.value))
        return QVariant(*d);
    if (const auto *s = std::get_if<std::string>(&request.value))
        return QVariant(QString::fromStdString(*s));
    return QVariant();
}

} // namespace phicore::nomaiq
