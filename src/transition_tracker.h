#pragma once

#include <optional>

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include "nomaiq_device.h"
#include "nomaiq_types.h"

namespace phicore::nomaiq {

class IntervalScheduler;

// Serials polled at the fast cadence, with the optional value that confirms
// each transition. Every mutation re-applies the period policy to the
// scheduler: fast while any serial is tracked, normal otherwise.
class TransitionTracker
{
public:
    explicit TransitionTracker(IntervalScheduler *scheduler = nullptr);

    void mark(const QString &serial,
              const std::optional<PropertyValue> &intended = std::nullopt,
              const QString &property = QLatin1String(props::kPower));
    void clear(const QString &serial);
    void reset();

    bool contains(const QString &serial) const;
    bool isEmpty() const { return m_serials.isEmpty(); }
    int size() const { return static_cast<int>(m_serials.size()); }
    QStringList serials() const;

    std::optional<PropertyValue> intendedValue(const QString &serial) const;

    // Completion detection on a freshly refreshed device. Returns true when
    // the device left the transition set.
    bool inspect(const Device &device);

    static bool isTerminalDoorStatus(const QString &status);
    static bool isMovingDoorStatus(const QString &status);

private:
    struct Intended {
        QString property;
        PropertyValue value;
    };

    void syncPeriod();

    IntervalScheduler *m_scheduler = nullptr;
    QSet<QString> m_serials;
    QHash<QString, Intended> m_intended;
};

} // namespace phicore::nomaiq
