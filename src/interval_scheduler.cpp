#include "interval_scheduler.h"

#include <algorithm>

#include "nomaiq_logging.h"

namespace phicore::nomaiq {

const char *schedulerPeriodName(SchedulerPeriod period)
{
    return period == SchedulerPeriod::Fast ? "fast" : "normal";
}

IntervalScheduler::IntervalScheduler(QObject *parent)
    : QObject(parent)
{
    m_timer.setSingleShot(false);
    m_timer.setInterval(currentIntervalMs());
    connect(&m_timer, &QTimer::timeout, this, &IntervalScheduler::fired);
}

void IntervalScheduler::setIntervals(int normalMs, int fastMs)
{
    m_normalMs = std::max(1, normalMs);
    m_fastMs = std::clamp(fastMs, 1, m_normalMs);
    rearm();
}

void IntervalScheduler::setMaxBackoffMs(int maxBackoffMs)
{
    m_maxBackoffMs = std::max(1, maxBackoffMs);
    if (m_backoffFailures > 0)
        rearm();
}

void IntervalScheduler::setPeriod(SchedulerPeriod period)
{
    if (period == m_period)
        return;

    m_period = period;
    qCDebug(schedulerLog) << "Poll period ->" << schedulerPeriodName(period) << currentIntervalMs() << "ms";
    emit periodChanged(period);
    rearm();
}

void IntervalScheduler::start()
{
    if (m_held) {
        m_resumeAfterHold = true;
        m_timer.setInterval(currentIntervalMs());
        return;
    }
    m_timer.start(currentIntervalMs());
}

void IntervalScheduler::stop()
{
    m_timer.stop();
    m_resumeAfterHold = false;
}

bool IntervalScheduler::isActive() const
{
    return m_timer.isActive();
}

void IntervalScheduler::holdRearm()
{
    if (m_held)
        return;
    m_held = true;
    if (m_timer.isActive()) {
        m_timer.stop();
        m_resumeAfterHold = true;
    }
}

void IntervalScheduler::releaseRearm()
{
    if (!m_held)
        return;
    m_held = false;

    const int interval = currentIntervalMs();
    if (m_resumeAfterHold) {
        m_resumeAfterHold = false;
        m_timer.start(interval);
    } else {
        m_timer.setInterval(interval);
    }
}

void IntervalScheduler::applyBackoff(int consecutiveFailures)
{
    const int failures = std::max(0, consecutiveFailures);
    if (failures == m_backoffFailures)
        return;
    m_backoffFailures = failures;
    qCDebug(schedulerLog) << "Backoff after" << failures << "failed ticks:" << currentIntervalMs() << "ms";
    rearm();
}

void IntervalScheduler::resetBackoff()
{
    applyBackoff(0);
}

int IntervalScheduler::currentIntervalMs() const
{
    const int base = m_period == SchedulerPeriod::Fast ? m_fastMs : m_normalMs;
    if (m_backoffFailures <= 0)
        return base;

    // Doubling stops at the cap, a base above the cap is left alone.
    const qint64 cap = std::max(base, m_maxBackoffMs);
    qint64 interval = base;
    for (int i = 0; i < m_backoffFailures && interval < cap; ++i)
        interval *= 2;
    return static_cast<int>(std::min(interval, cap));
}

int IntervalScheduler::armedIntervalMs() const
{
    return m_timer.interval();
}

void IntervalScheduler::rearm()
{
    // releaseRearm() applies the latest interval.
    if (m_held)
        return;

    const int interval = currentIntervalMs();
    if (m_timer.isActive())
        m_timer.start(interval);
    else
        m_timer.setInterval(interval);
}

} // namespace phicore::nomaiq
