#pragma once

#include <QList>
#include <QString>
#include <QVariant>
#include <QVariantHash>

#include "nomaiq_device.h"
#include "nomaiq_types.h"

namespace phicore::nomaiq {

struct PropertyWrite {
    QString name;
    PropertyValue value;
};

using PropertyWriteList = QList<PropertyWrite>;

// Locally asserted values of an entity while its command is in flight.
// Reads prefer these values over the confirmed roster until invalidated.
class OptimisticOverlay
{
public:
    explicit OptimisticOverlay(QString onStateKey = QStringLiteral("is_on"));

    void assertValues(const QVariantHash &values);

    // Sends the writes in protocol order: power, brightness, mode, then the
    // mode-dependent values. Stops at the first failing write and drops the
    // asserted on-state so reads fall back to the roster.
    bool commit(Device &device, const PropertyWriteList &writes, Failure *failure = nullptr);

    void invalidate();
    void discard(const QString &key);

    bool contains(const QString &key) const;
    QVariant value(const QString &key) const;
    bool isEmpty() const { return m_values.isEmpty(); }
    const QString &onStateKey() const { return m_onStateKey; }

    static PropertyWriteList orderedWrites(const PropertyWriteList &writes);

private:
    QString m_onStateKey;
    QVariantHash m_values;
};

} // namespace phicore::nomaiq
