#pragma once

#include <optional>

#include <QMetaType>

namespace phicore::nomaiq {

inline constexpr int kMinMired = 153;
inline constexpr int kMaxMired = 500;

struct HsColor {
    double hue = 0.0;        // degrees, [0, 360)
    double saturation = 0.0; // percent, [0, 100]

    bool operator==(const HsColor &other) const
    {
        return hue == other.hue && saturation == other.saturation;
    }
};

// Device brightness 0..100 <-> exposed 0..255.
int brightnessToExposed(int deviceValue);
int brightnessFromExposed(int exposedValue);

// Device colour temperature 0..100 (100 = coolest) <-> mireds 153..500.
int colorTempToMired(int deviceValue);
int colorTempFromMired(int mired);

double normalizeHue(double hue);

} // namespace phicore::nomaiq

Q_DECLARE_METATYPE(phicore::nomaiq::HsColor)
