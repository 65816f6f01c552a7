#include "transition_tracker.h"

#include <algorithm>

#include "interval_scheduler.h"
#include "nomaiq_logging.h"

namespace phicore::nomaiq {

TransitionTracker::TransitionTracker(IntervalScheduler *scheduler)
    : m_scheduler(scheduler)
{
    syncPeriod();
}

void TransitionTracker::mark(const QString &serial,
                             const std::optional<PropertyValue> &intended,
                             const QString &property)
{
    if (serial.isEmpty())
        return;

    m_serials.insert(serial);
    if (intended.has_value())
        m_intended.insert(serial, Intended{property, *intended});
    else
        m_intended.remove(serial);

    qCDebug(coordinatorLog).noquote() << "Transition marked:" << serial
                                  << (intended ? propertyToString(*intended) : QStringLiteral("(status)"));
    syncPeriod();
}

void TransitionTracker::clear(const QString &serial)
{
    m_intended.remove(serial);
    if (m_serials.remove(serial))
        qCDebug(coordinatorLog).noquote() << "Transition cleared:" << serial;
    syncPeriod();
}

void TransitionTracker::reset()
{
    m_serials.clear();
    m_intended.clear();
    syncPeriod();
}

bool TransitionTracker::contains(const QString &serial) const
{
    return m_serials.contains(serial);
}

QStringList TransitionTracker::serials() const
{
    QStringList out(m_serials.cbegin(), m_serials.cend());
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<PropertyValue> TransitionTracker::intendedValue(const QString &serial) const
{
    const auto it = m_intended.constFind(serial);
    if (it == m_intended.cend())
        return std::nullopt;
    return it->value;
}

bool TransitionTracker::inspect(const Device &device)
{
    const QString &serial = device.serial();

    const auto intendedIt = m_intended.constFind(serial);
    if (intendedIt != m_intended.cend()) {
        const std::optional<PropertyValue> confirmed = device.property(intendedIt->property);
        if (confirmed && propertyMatches(*confirmed, intendedIt->value)) {
            clear(serial);
            return true;
        }
        return false;
    }

    const std::optional<QString> status = propertyAsString(device.property(QLatin1String(props::kDoorStatus)));
    if (!status)
        return false;

    if (isTerminalDoorStatus(*status)) {
        if (!m_serials.contains(serial))
            return false;
        clear(serial);
        return true;
    }
    if (isMovingDoorStatus(*status) && !m_serials.contains(serial))
        mark(serial);
    return false;
}

bool TransitionTracker::isTerminalDoorStatus(const QString &status)
{
    return status == QLatin1String("opened") || status == QLatin1String("closed");
}

bool TransitionTracker::isMovingDoorStatus(const QString &status)
{
    return status == QLatin1String("opening") || status == QLatin1String("closing");
}

void TransitionTracker::syncPeriod()
{
    if (!m_scheduler)
        return;
    m_scheduler->setPeriod(m_serials.isEmpty() ? SchedulerPeriod::Normal : SchedulerPeriod::Fast);
}

} // namespace phicore::nomaiq
