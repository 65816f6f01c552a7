#include "nomaiq_commands.h"

#include <algorithm>
#include <cmath>
#include <optional>

#include <QJsonDocument>
#include <QJsonObject>

#include "nomaiq_conversions.h"

namespace phicore::nomaiq {

namespace {

inline constexpr int kDefaultSaturation = 100;

std::optional<double> variantAsDouble(const QVariant &value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool() ? 1.0 : 0.0;
    case QMetaType::Int:
    case QMetaType::LongLong:
    case QMetaType::Double:
        return value.toDouble();
    case QMetaType::QString: {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok)
            return parsed;
        break;
    }
    default:
        break;
    }
    return std::nullopt;
}

std::optional<bool> variantAsBool(const QVariant &value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::LongLong:
        return value.toLongLong() != 0;
    case QMetaType::Double:
        return value.toDouble() != 0.0;
    case QMetaType::QString: {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("off"))
            return false;
        break;
    }
    default:
        break;
    }
    return std::nullopt;
}

std::optional<QString> commandText(const QVariant &value, const QByteArray &valueJson)
{
    if (value.typeId() == QMetaType::QString)
        return value.toString().trimmed().toLower();
    if (!valueJson.isEmpty()) {
        const QJsonDocument doc = QJsonDocument::fromJson(valueJson);
        if (doc.isObject()) {
            const QString command = doc.object().value(QStringLiteral("command")).toString().trimmed().toLower();
            if (!command.isEmpty())
                return command;
        }
    }
    return std::nullopt;
}

} // namespace

bool buildLightCommand(const QString &channelExternalId,
                       const QVariant &value,
                       const LightController &light,
                       LightCommand *command,
                       QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    if (!command)
        return fail(QStringLiteral("Command object is null"));
    *command = LightCommand();

    if (!value.isValid())
        return fail(QStringLiteral("Expected scalar value"));

    if (channelExternalId == QLatin1String("on")) {
        const auto on = variantAsBool(value);
        if (!on.has_value())
            return fail(QStringLiteral("Invalid boolean value"));
        command->turnOff = !*on;
    } else if (channelExternalId == QLatin1String("bri")) {
        const auto percent = variantAsDouble(value);
        if (!percent.has_value() || !std::isfinite(*percent))
            return fail(QStringLiteral("Invalid brightness value"));
        const int rounded = static_cast<int>(std::lround(std::clamp(*percent, 0.0, 100.0)));
        if (rounded == 0)
            command->turnOff = true;
        else
            command->turnOn.brightness = brightnessToExposed(rounded);
    } else if (channelExternalId == QLatin1String("ct")) {
        if (!light.isWhiteCapable() && !light.isColorCapable())
            return fail(QStringLiteral("Light has no color temperature"));
        const auto mired = variantAsDouble(value);
        if (!mired.has_value() || !std::isfinite(*mired))
            return fail(QStringLiteral("Invalid color temperature value"));
        command->turnOn.colorTempMired =
            static_cast<int>(std::lround(std::clamp(*mired, double(kMinMired), double(kMaxMired))));
    } else if (channelExternalId == QLatin1String("hue") || channelExternalId == QLatin1String("sat")) {
        if (!light.isColorCapable())
            return fail(QStringLiteral("Light has no color support"));
        const auto component = variantAsDouble(value);
        if (!component.has_value() || !std::isfinite(*component))
            return fail(QStringLiteral("Invalid color value"));

        HsColor color = light.hsColor().value_or(HsColor{0.0, double(kDefaultSaturation)});
        if (channelExternalId == QLatin1String("hue"))
            color.hue = normalizeHue(*component);
        else
            color.saturation = std::clamp(*component, 0.0, 100.0);
        command->turnOn.hsColor = color;
    } else {
        return fail(QStringLiteral("Unsupported channel"));
    }

    if (error)
        error->clear();
    return true;
}

bool parseDoorCommand(const QString &channelExternalId,
                      const QVariant &value,
                      const QByteArray &valueJson,
                      DoorCommand *command,
                      QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    if (channelExternalId != QLatin1String("door_command"))
        return fail(QStringLiteral("Unsupported channel"));

    const std::optional<QString> text = commandText(value, valueJson);
    if (!text.has_value())
        return fail(QStringLiteral("Expected door command string"));

    DoorCommand parsed;
    if (*text == QLatin1String("open"))
        parsed = DoorCommand::Open;
    else if (*text == QLatin1String("close"))
        parsed = DoorCommand::Close;
    else if (*text == QLatin1String("stop"))
        parsed = DoorCommand::Stop;
    else
        return fail(QStringLiteral("Unknown door command: %1").arg(*text));

    if (command)
        *command = parsed;
    if (error)
        error->clear();
    return true;
}

} // namespace phicore::nomaiq
