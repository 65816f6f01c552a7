#include "garage_door_controller.h"

#include <utility>

#include <QDateTime>

#include "nomaiq_logging.h"
#include "transition_tracker.h"
#include "update_coordinator.h"

namespace phicore::nomaiq {

GarageDoorController::GarageDoorController(UpdateCoordinator *coordinator, QString serial)
    : m_coordinator(coordinator)
    , m_serial(std::move(serial))
{
}

void GarageDoorController::setUnixClock(UnixClock clock)
{
    m_unixClock = std::move(clock);
}

QString GarageDoorController::uniqueId() const
{
    return QStringLiteral("nomaiq_cover_%1").arg(m_serial);
}

QString GarageDoorController::name() const
{
    const DevicePtr device = currentDevice();
    return device ? device->name() : m_serial;
}

bool GarageDoorController::isAvailable() const
{
    return currentDevice() != nullptr;
}

std::optional<QString> GarageDoorController::doorStatus() const
{
    const DevicePtr device = currentDevice();
    if (!device)
        return std::nullopt;
    return propertyAsString(device->property(QLatin1String(props::kDoorStatus)));
}

bool GarageDoorController::isClosed() const
{
    return doorStatus() == QStringLiteral("closed");
}

bool GarageDoorController::isOpening() const
{
    return doorStatus() == QStringLiteral("opening");
}

bool GarageDoorController::isClosing() const
{
    return doorStatus() == QStringLiteral("closing");
}

bool GarageDoorController::open(Failure *failure)
{
    return pulseToggle("open", failure);
}

bool GarageDoorController::close(Failure *failure)
{
    return pulseToggle("close", failure);
}

bool GarageDoorController::stop(Failure *failure)
{
    return pulseToggle("stop", failure);
}

void GarageDoorController::update()
{
    if (!m_coordinator)
        return;
    m_syncAfterRefresh = true;
    m_coordinator->requestRefresh();
}

void GarageDoorController::reconcile()
{
    if (!m_syncAfterRefresh)
        return;
    m_syncAfterRefresh = false;
    syncTransitionState();
}

void GarageDoorController::syncTransitionState()
{
    if (!m_coordinator)
        return;
    const std::optional<QString> status = doorStatus();
    if (status && TransitionTracker::isMovingDoorStatus(*status))
        m_coordinator->markTransition(m_serial);
    else
        m_coordinator->clearTransition(m_serial);
}

bool GarageDoorController::pulseToggle(const char *action, Failure *failure)
{
    const DevicePtr device = currentDevice();
    if (!device) {
        setFailure(failure, FailureKind::Command, QStringLiteral("Garage door %1 is not available").arg(m_serial));
        return false;
    }

    const std::int64_t nowSecs = m_unixClock ? m_unixClock() : QDateTime::currentSecsSinceEpoch();
    const PropertyValue token(QString::number(nowSecs));

    Failure writeFailure;
    if (!device->setProperty(QLatin1String(props::kDoorToggle), token, &writeFailure)) {
        const QString detail = writeFailure.message.isEmpty() ? QStringLiteral("write rejected")
                                                               : writeFailure.message;
        qCWarning(coverLog).noquote() << "Failed to" << action << "garage door" << m_serial << ":" << detail;
        setFailure(failure, FailureKind::Command,
                   QStringLiteral("Failed to %1 garage door %2: %3").arg(QLatin1String(action), m_serial, detail));
        m_coordinator->requestRefresh();
        return false;
    }

    qCInfo(coverLog).noquote() << "Garage door" << m_serial << action << "requested";
    m_coordinator->markTransition(m_serial);
    m_coordinator->requestRefresh();
    return true;
}

DevicePtr GarageDoorController::currentDevice() const
{
    return m_coordinator ? m_coordinator->device(m_serial) : DevicePtr();
}

} // namespace phicore::nomaiq
