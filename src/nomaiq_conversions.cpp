#include "nomaiq_conversions.h"

#include <algorithm>
#include <cmath>

namespace phicore::nomaiq {

int brightnessToExposed(int deviceValue)
{
    return static_cast<int>(std::lround(deviceValue * 255.0 / 100.0));
}

int brightnessFromExposed(int exposedValue)
{
    return static_cast<int>(std::lround(exposedValue * 100.0 / 255.0));
}

int colorTempToMired(int deviceValue)
{
    const double span = kMaxMired - kMinMired;
    return static_cast<int>(std::lround(kMinMired + (100 - deviceValue) * span / 100.0));
}

int colorTempFromMired(int mired)
{
    const double span = kMaxMired - kMinMired;
    const long value = std::lround(100.0 - (mired - kMinMired) * 100.0 / span);
    return static_cast<int>(std::clamp<long>(value, 0, 100));
}

double normalizeHue(double hue)
{
    double wrapped = std::fmod(hue, 360.0);
    if (wrapped < 0.0)
        wrapped += 360.0;
    return wrapped;
}

} // namespace phicore::nomaiq
