#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <QString>

#include "nomaiq_device.h"

namespace phicore::nomaiq {

class UpdateCoordinator;

// Control surface of one NomaIQ garage-door opener ("gdo"). The opener has
// a single toggle input; open, close and stop all pulse it.
class GarageDoorController
{
public:
    using UnixClock = std::function<std::int64_t()>;

    GarageDoorController(UpdateCoordinator *coordinator, QString serial);

    // Seconds since the epoch, used as the toggle payload.
    void setUnixClock(UnixClock clock);

    const QString &serial() const { return m_serial; }
    QString uniqueId() const;
    QString name() const;
    bool isAvailable() const;

    std::optional<QString> doorStatus() const;
    bool isClosed() const;
    bool isOpening() const;
    bool isClosing() const;

    bool open(Failure *failure = nullptr);
    bool close(Failure *failure = nullptr);
    bool stop(Failure *failure = nullptr);

    // Requests a refresh; the transition is synced against the roster it
    // publishes, in reconcile().
    void update();
    bool isSyncPending() const { return m_syncAfterRefresh; }

    // Called after every published roster.
    void reconcile();
    void syncTransitionState();

private:
    bool pulseToggle(const char *action, Failure *failure);
    DevicePtr currentDevice() const;

    UpdateCoordinator *m_coordinator = nullptr;
    QString m_serial;
    UnixClock m_unixClock;
    bool m_syncAfterRefresh = false;
};

} // namespace phicore::nomaiq
