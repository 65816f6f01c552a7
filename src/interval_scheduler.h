#pragma once

#include <QObject>
#include <QTimer>

#include "nomaiq_config.h"

namespace phicore::nomaiq {

enum class SchedulerPeriod {
    Normal,
    Fast
};

const char *schedulerPeriodName(SchedulerPeriod period);

// Repeating poll timer with a slow and a fast period. A period change
// restarts the countdown at the new interval. Holding the scheduler stops
// a running timer so it cannot fire inside a tick; releaseRearm() starts
// it again at the current interval.
class IntervalScheduler : public QObject
{
    Q_OBJECT

public:
    explicit IntervalScheduler(QObject *parent = nullptr);

    void setIntervals(int normalMs, int fastMs);
    int normalIntervalMs() const { return m_normalMs; }
    int fastIntervalMs() const { return m_fastMs; }

    void setMaxBackoffMs(int maxBackoffMs);
    int maxBackoffMs() const { return m_maxBackoffMs; }

    void setPeriod(SchedulerPeriod period);
    SchedulerPeriod currentPeriod() const { return m_period; }

    void start();
    void stop();
    bool isActive() const;

    void holdRearm();
    void releaseRearm();
    bool isHeld() const { return m_held; }

    // Stretches the interval to period * 2^consecutiveFailures, capped at
    // the max backoff. resetBackoff() returns to the plain period.
    void applyBackoff(int consecutiveFailures);
    void resetBackoff();
    int backoffFailures() const { return m_backoffFailures; }

    // Interval the timer runs (or would run) at.
    int currentIntervalMs() const;
    int armedIntervalMs() const;

signals:
    void fired();
    void periodChanged(phicore::nomaiq::SchedulerPeriod period);

private:
    void rearm();

    QTimer m_timer;
    SchedulerPeriod m_period = SchedulerPeriod::Normal;
    int m_normalMs = kDefaultPollIntervalMs;
    int m_fastMs = kDefaultTransitionIntervalMs;
    int m_maxBackoffMs = kDefaultRetryIntervalMs;
    int m_backoffFailures = 0;
    bool m_held = false;
    bool m_resumeAfterHold = false;
};

} // namespace phicore::nomaiq
