#pragma once

#include <optional>

#include <QString>

#include "nomaiq_conversions.h"
#include "nomaiq_device.h"
#include "optimistic_overlay.h"

namespace phicore::nomaiq {

class UpdateCoordinator;

enum class LightColorMode {
    OnOff,
    ColorTemp,
    Hs
};

const char *lightColorModeName(LightColorMode mode);

struct LightTurnOnRequest {
    std::optional<int> brightness;     // 0..255
    std::optional<int> colorTempMired; // 153..500
    std::optional<HsColor> hsColor;
};

// Control surface of one NomaIQ light. Every read re-resolves the device
// from the coordinator roster, with in-flight command values on top.
class LightController
{
public:
    LightController(UpdateCoordinator *coordinator, QString serial);

    const QString &serial() const { return m_serial; }
    QString uniqueId() const;
    QString name() const;
    bool isAvailable() const;

    bool isColorCapable() const;
    bool isWhiteCapable() const;

    std::optional<bool> isOn() const;
    std::optional<int> brightness() const;
    std::optional<int> colorTempMired() const;
    std::optional<HsColor> hsColor() const;
    LightColorMode colorMode() const;

    bool turnOn(const LightTurnOnRequest &request = LightTurnOnRequest(), Failure *failure = nullptr);
    bool turnOff(Failure *failure = nullptr);

    // Drops the asserted values and asks for a fresh poll.
    void update();

    // Called after each published roster. Asserted values survive only
    // while the light is still in transition.
    void reconcile();

    const OptimisticOverlay &overlay() const { return m_overlay; }

private:
    DevicePtr currentDevice() const;

    UpdateCoordinator *m_coordinator = nullptr;
    QString m_serial;
    OptimisticOverlay m_overlay;
};

} // namespace phicore::nomaiq
