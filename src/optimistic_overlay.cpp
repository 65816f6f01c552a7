#include "optimistic_overlay.h"

#include <algorithm>
#include <utility>

#include "nomaiq_logging.h"

namespace phicore::nomaiq {

namespace {

int writeRank(const QString &name)
{
    if (name == QLatin1String(props::kPower))
        return 0;
    if (name == QLatin1String(props::kBrightness))
        return 1;
    if (name == QLatin1String(props::kMode))
        return 2;
    return 3;
}

} // namespace

OptimisticOverlay::OptimisticOverlay(QString onStateKey)
    : m_onStateKey(std::move(onStateKey))
{
}

void OptimisticOverlay::assertValues(const QVariantHash &values)
{
    for (auto it = values.cbegin(); it != values.cend(); ++it)
        m_values.insert(it.key(), it.value());
}

bool OptimisticOverlay::commit(Device &device, const PropertyWriteList &writes, Failure *failure)
{
    const PropertyWriteList ordered = orderedWrites(writes);
    for (const PropertyWrite &write : ordered) {
        Failure writeFailure;
        if (device.setProperty(write.name, write.value, &writeFailure))
            continue;

        m_values.remove(m_onStateKey);
        const QString detail = writeFailure.message.isEmpty() ? QStringLiteral("write rejected")
                                                               : writeFailure.message;
        qCWarning(lightLog).noquote() << "Setting" << write.name << "on" << device.serial()
                                        << "failed:" << detail;
        setFailure(failure, FailureKind::Command,
                   QStringLiteral("Setting %1 on %2 failed: %3").arg(write.name, device.serial(), detail));
        return false;
    }
    return true;
}

void OptimisticOverlay::invalidate()
{
    m_values.clear();
}

void OptimisticOverlay::discard(const QString &key)
{
    m_values.remove(key);
}

bool OptimisticOverlay::contains(const QString &key) const
{
    return m_values.contains(key);
}

QVariant OptimisticOverlay::value(const QString &key) const
{
    return m_values.value(key);
}

PropertyWriteList OptimisticOverlay::orderedWrites(const PropertyWriteList &writes)
{
    PropertyWriteList ordered = writes;
    std::stable_sort(ordered.begin(), ordered.end(), [](const PropertyWrite &a, const PropertyWrite &b) {
        return writeRank(a.name) < writeRank(b.name);
    });
    return ordered;
}

} // namespace phicore::nomaiq
