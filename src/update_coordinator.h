#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <QElapsedTimer>
#include <QObject>
#include <QStringList>

#include "interval_scheduler.h"
#include "nomaiq_config.h"
#include "nomaiq_device.h"
#include "nomaiq_source.h"
#include "transition_tracker.h"

namespace phicore::nomaiq {

enum class TickState {
    Idle,
    Authenticating,
    FetchingRoster,
    Refreshing,
    Publishing,
    FailedTick
};

enum class RefreshScope {
    Full,
    TransitionOnly
};

const char *tickStateName(TickState state);

struct TickReport {
    RefreshScope scope = RefreshScope::Full;
    std::int64_t startedMs = 0;
    QStringList refreshed;
    QStringList failed;
    QStringList completed;
    // The tick deadline passed before every device was refreshed; the
    // rest kept their previous snapshot and are listed in failed.
    bool truncated = false;
};

struct CoordinatorOptions {
    int normalIntervalMs = kDefaultPollIntervalMs;
    int fastIntervalMs = kDefaultTransitionIntervalMs;
    int maxBackoffMs = kDefaultRetryIntervalMs;
    int tickTimeoutMs = kDefaultTickTimeoutMs;
};

// Adaptive polling loop for one Ayla session. Owns the published roster,
// the transition set and the scheduler; entities read the roster and
// report commands through markTransition() and requestRefresh().
class UpdateCoordinator : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<std::int64_t()>;

    explicit UpdateCoordinator(DeviceSource *source,
                               const CoordinatorOptions &options = CoordinatorOptions(),
                               QObject *parent = nullptr);

    // Monotonic milliseconds. Defaults to a QElapsedTimer.
    void setClock(Clock clock);

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    const DeviceRoster &roster() const { return m_roster; }
    DevicePtr device(const QString &serial) const;

    // Coalesces into the in-flight tick, otherwise queues one tick on the
    // event loop. Repeated requests before it runs collapse into one.
    void requestRefresh();
    bool isRefreshQueued() const { return m_refreshQueued; }

    void markTransition(const QString &serial,
                        const std::optional<PropertyValue> &intended = std::nullopt,
                        const QString &property = QLatin1String(props::kPower));
    void clearTransition(const QString &serial);
    bool isInTransition(const QString &serial) const;

    SchedulerPeriod currentPeriod() const { return m_scheduler.currentPeriod(); }
    TickState state() const { return m_state; }
    std::optional<std::int64_t> lastFullUpdateMs() const { return m_lastFullUpdateMs; }
    const TickReport &lastReport() const { return m_lastReport; }
    const Failure &lastFailure() const { return m_lastFailure; }
    int consecutiveFailures() const { return m_consecutiveFailures; }

    const IntervalScheduler &scheduler() const { return m_scheduler; }
    const TransitionTracker &tracker() const { return m_tracker; }

    // Runs one tick now. Returns false without doing anything while a tick
    // is in flight; use requestRefresh() to get a follow-up tick instead.
    // Returns true when the tick published a roster.
    bool runTick();

signals:
    void rosterPublished(const phicore::nomaiq::DeviceRoster &roster);
    void updateFailed(const phicore::nomaiq::Failure &failure);

private:
    bool executeTick();
    bool authenticate(Failure *failure);
    bool refreshRoster(DeviceRoster *fresh, std::int64_t startedMs, TickReport *report, Failure *failure);
    bool withinDeadline(std::int64_t startedMs, const char *stage, Failure *failure) const;
    void failTick(const Failure &failure, const TickReport &report);
    void setState(TickState state);
    std::int64_t now() const;

    DeviceSource *m_source = nullptr;
    CoordinatorOptions m_options;

    IntervalScheduler m_scheduler;
    TransitionTracker m_tracker;

    QElapsedTimer m_elapsed;
    Clock m_clock;

    DeviceRoster m_roster;
    QStringList m_deferred;
    std::optional<std::int64_t> m_lastFullUpdateMs;
    TickState m_state = TickState::Idle;
    TickReport m_lastReport;
    Failure m_lastFailure;
    int m_consecutiveFailures = 0;

    bool m_running = false;
    bool m_tickInFlight = false;
    bool m_tickPending = false;
    bool m_refreshQueued = false;
};

} // namespace phicore::nomaiq
