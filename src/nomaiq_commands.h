#pragma once

#include <QByteArray>
#include <QString>
#include <QVariant>

#include "light_controller.h"

namespace phicore::nomaiq {

struct LightCommand {
    bool turnOff = false;
    LightTurnOnRequest turnOn;
};

// Maps a channel write onto a light command. An invalid QVariant means the
// write carried no scalar. hue and sat writes keep the other component of
// the current colour; bri is a percentage and 0 turns the light off.
bool buildLightCommand(const QString &channelExternalId,
                       const QVariant &value,
                       const LightController &light,
                       LightCommand *command,
                       QString *error = nullptr);

enum class DoorCommand {
    Open,
    Close,
    Stop
};

// Accepts the command as a scalar string or as {"command": "..."} JSON.
bool parseDoorCommand(const QString &channelExternalId,
                      const QVariant &value,
                      const QByteArray &valueJson,
                      DoorCommand *command,
                      QString *error = nullptr);

} // namespace phicore::nomaiq
