#include "light_controller.h"

#include <algorithm>
#include <utility>

#include "nomaiq_logging.h"
#include "update_coordinator.h"

namespace phicore::nomaiq {

namespace {

inline constexpr char kKeyIsOn[] = "is_on";
inline constexpr char kKeyBrightness[] = "brightness";
inline constexpr char kKeyColorTemp[] = "color_temp";
inline constexpr char kKeyHsColor[] = "hs_color";

inline constexpr char kModeColour[] = "colour";
inline constexpr char kModeWhite[] = "white";

} // namespace

const char *lightColorModeName(LightColorMode mode)
{
    switch (mode) {
    case LightColorMode::OnOff:
        return "onoff";
    case LightColorMode::ColorTemp:
        return "color_temp";
    case LightColorMode::Hs:
        return "hs";
    }
    return "unknown";
}

LightController::LightController(UpdateCoordinator *coordinator, QString serial)
    : m_coordinator(coordinator)
    , m_serial(std::move(serial))
    , m_overlay(QLatin1String(kKeyIsOn))
{
}

QString LightController::uniqueId() const
{
    return QStringLiteral("nomaiq_light_%1").arg(m_serial);
}

QString LightController::name() const
{
    const DevicePtr device = currentDevice();
    if (!device)
        return m_serial;
    const std::optional<QString> voiceName = propertyAsString(device->property(QLatin1String(props::kVoiceData)));
    if (voiceName && !voiceName->trimmed().isEmpty())
        return voiceName->trimmed();
    return device->name();
}

bool LightController::isAvailable() const
{
    return currentDevice() != nullptr;
}

bool LightController::isColorCapable() const
{
    const DevicePtr device = currentDevice();
    return device && device->hasProperty(QLatin1String(props::kColorSelect))
        && device->hasProperty(QLatin1String(props::kColorSaturation));
}

bool LightController::isWhiteCapable() const
{
    const DevicePtr device = currentDevice();
    return device && device->hasProperty(QLatin1String(props::kColorTemp));
}

std::optional<bool> LightController::isOn() const
{
    if (m_overlay.contains(QLatin1String(kKeyIsOn)))
        return m_overlay.value(QLatin1String(kKeyIsOn)).toBool();
    const DevicePtr device = currentDevice();
    if (!device)
        return std::nullopt;
    return propertyAsBool(device->property(QLatin1String(props::kPower)));
}

std::optional<int> LightController::brightness() const
{
    if (m_overlay.contains(QLatin1String(kKeyBrightness)))
        return m_overlay.value(QLatin1String(kKeyBrightness)).toInt();
    const DevicePtr device = currentDevice();
    if (!device)
        return std::nullopt;
    const std::optional<std::int64_t> value = propertyAsInt(device->property(QLatin1String(props::kBrightness)));
    if (!value)
        return std::nullopt;
    return brightnessToExposed(static_cast<int>(*value));
}

std::optional<int> LightController::colorTempMired() const
{
    if (m_overlay.contains(QLatin1String(kKeyColorTemp)))
        return m_overlay.value(QLatin1String(kKeyColorTemp)).toInt();
    const DevicePtr device = currentDevice();
    if (!device || propertyAsString(device->property(QLatin1String(props::kMode))) != QLatin1String(kModeWhite))
        return std::nullopt;
    const std::optional<std::int64_t> value = propertyAsInt(device->property(QLatin1String(props::kColorTemp)));
    if (!value)
        return std::nullopt;
    return colorTempToMired(static_cast<int>(*value));
}

std::optional<HsColor> LightController::hsColor() const
{
    if (m_overlay.contains(QLatin1String(kKeyHsColor)))
        return m_overlay.value(QLatin1String(kKeyHsColor)).value<HsColor>();
    const DevicePtr device = currentDevice();
    if (!device || propertyAsString(device->property(QLatin1String(props::kMode))) != QLatin1String(kModeColour))
        return std::nullopt;
    const std::optional<std::int64_t> hue = propertyAsInt(device->property(QLatin1String(props::kColorSelect)));
    const std::optional<std::int64_t> saturation =
        propertyAsInt(device->property(QLatin1String(props::kColorSaturation)));
    if (!hue || !saturation)
        return std::nullopt;
    return HsColor{normalizeHue(static_cast<double>(*hue)), static_cast<double>(*saturation)};
}

LightColorMode LightController::colorMode() const
{
    const DevicePtr device = currentDevice();
    if (!device || !propertyAsBool(device->property(QLatin1String(props::kPower))).value_or(false))
        return LightColorMode::OnOff;

    const QString mode = propertyAsString(device->property(QLatin1String(props::kMode)))
                             .value_or(QLatin1String(kModeWhite));
    if (mode == QLatin1String(kModeColour) && isColorCapable())
        return LightColorMode::Hs;
    if (mode == QLatin1String(kModeWhite) && (isWhiteCapable() || isColorCapable()))
        return LightColorMode::ColorTemp;
    return LightColorMode::OnOff;
}

bool LightController::turnOn(const LightTurnOnRequest &request, Failure *failure)
{
    const DevicePtr device = currentDevice();
    if (!device) {
        setFailure(failure, FailureKind::Command, QStringLiteral("Light %1 is not available").arg(m_serial));
        return false;
    }

    QVariantHash asserted;
    asserted.insert(QLatin1String(kKeyIsOn), true);

    PropertyWriteList writes;
    writes.push_back({QLatin1String(props::kPower), PropertyValue(std::int64_t(1))});

    if (request.brightness) {
        const int exposed = std::clamp(*request.brightness, 0, 255);
        asserted.insert(QLatin1String(kKeyBrightness), exposed);
        writes.push_back({QLatin1String(props::kBrightness),
                          PropertyValue(std::int64_t(brightnessFromExposed(exposed)))});
    }

    if (request.hsColor) {
        const HsColor color{normalizeHue(request.hsColor->hue), std::clamp(request.hsColor->saturation, 0.0, 100.0)};
        asserted.insert(QLatin1String(kKeyHsColor), QVariant::fromValue(color));
        writes.push_back({QLatin1String(props::kMode), PropertyValue(QString::fromLatin1(kModeColour))});
        writes.push_back({QLatin1String(props::kColorSelect), PropertyValue(std::int64_t(color.hue))});
        writes.push_back({QLatin1String(props::kColorSaturation), PropertyValue(std::int64_t(color.saturation))});
    } else if (request.colorTempMired) {
        const int mired = std::clamp(*request.colorTempMired, kMinMired, kMaxMired);
        asserted.insert(QLatin1String(kKeyColorTemp), mired);
        writes.push_back({QLatin1String(props::kMode), PropertyValue(QString::fromLatin1(kModeWhite))});
        writes.push_back({QLatin1String(props::kColorTemp), PropertyValue(std::int64_t(colorTempFromMired(mired)))});
    }

    qCDebug(lightLog).noquote() << "Turning on" << m_serial << "with" << writes.size() << "writes";
    m_overlay.assertValues(asserted);

    const bool ok = m_overlay.commit(*device, writes, failure);
    if (ok)
        m_coordinator->markTransition(m_serial, PropertyValue(std::int64_t(1)));
    else
        qCWarning(lightLog).noquote() << "Failed to turn on light" << m_serial;

    m_coordinator->requestRefresh();
    return ok;
}

bool LightController::turnOff(Failure *failure)
{
    const DevicePtr device = currentDevice();
    if (!device) {
        setFailure(failure, FailureKind::Command, QStringLiteral("Light %1 is not available").arg(m_serial));
        return false;
    }

    qCDebug(lightLog).noquote() << "Turning off" << m_serial;
    QVariantHash asserted;
    asserted.insert(QLatin1String(kKeyIsOn), false);
    m_overlay.assertValues(asserted);

    const PropertyWriteList writes{{QLatin1String(props::kPower), PropertyValue(std::int64_t(0))}};
    const bool ok = m_overlay.commit(*device, writes, failure);
    if (ok)
        m_coordinator->markTransition(m_serial, PropertyValue(std::int64_t(0)));
    else
        qCWarning(lightLog).noquote() << "Failed to send power=0 to" << m_serial;

    m_coordinator->requestRefresh();
    return ok;
}

void LightController::update()
{
    m_overlay.invalidate();
    if (m_coordinator)
        m_coordinator->requestRefresh();
}

void LightController::reconcile()
{
    if (m_overlay.isEmpty() || (m_coordinator && m_coordinator->isInTransition(m_serial)))
        return;
    m_overlay.invalidate();
}

DevicePtr LightController::currentDevice() const
{
    return m_coordinator ? m_coordinator->device(m_serial) : DevicePtr();
}

} // namespace phicore::nomaiq
