#include "update_coordinator.h"

#include <utility>

#include <QTimer>

#include "nomaiq_logging.h"

namespace phicore::nomaiq {

const char *tickStateName(TickState state)
{
    switch (state) {
    case TickState::Idle:
        return "idle";
    case TickState::Authenticating:
        return "authenticating";
    case TickState::FetchingRoster:
        return "fetching-roster";
    case TickState::Refreshing:
        return "refreshing";
    case TickState::Publishing:
        return "publishing";
    case TickState::FailedTick:
        return "failed-tick";
    }
    return "unknown";
}

UpdateCoordinator::UpdateCoordinator(DeviceSource *source, const CoordinatorOptions &options, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_options(options)
    , m_tracker(&m_scheduler)
{
    m_scheduler.setIntervals(m_options.normalIntervalMs, m_options.fastIntervalMs);
    m_scheduler.setMaxBackoffMs(m_options.maxBackoffMs);
    m_elapsed.start();

    // Nested event loops inside a tick can still deliver a timeout that
    // was queued before the scheduler was held.
    connect(&m_scheduler, &IntervalScheduler::fired, this, [this]() {
        if (m_running && !m_tickInFlight)
            runTick();
    });
}

void UpdateCoordinator::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

void UpdateCoordinator::start()
{
    if (m_running)
        return;
    m_running = true;
    m_scheduler.start();
    qCInfo(coordinatorLog) << "Coordinator started, normal" << m_scheduler.normalIntervalMs()
                           << "ms, fast" << m_scheduler.fastIntervalMs() << "ms";
    requestRefresh();
}

void UpdateCoordinator::stop()
{
    if (!m_running)
        return;
    m_running = false;
    m_scheduler.stop();
    m_scheduler.resetBackoff();
    m_tracker.reset();
    m_consecutiveFailures = 0;
    qCInfo(coordinatorLog) << "Coordinator stopped";
}

DevicePtr UpdateCoordinator::device(const QString &serial) const
{
    return findDevice(m_roster, serial);
}

void UpdateCoordinator::requestRefresh()
{
    if (m_tickInFlight) {
        m_tickPending = true;
        return;
    }
    if (m_refreshQueued)
        return;

    m_refreshQueued = true;
    QTimer::singleShot(0, this, [this]() {
        m_refreshQueued = false;
        if (m_running)
            runTick();
    });
}

void UpdateCoordinator::markTransition(const QString &serial,
                                       const std::optional<PropertyValue> &intended,
                                       const QString &property)
{
    m_tracker.mark(serial, intended, property);
}

void UpdateCoordinator::clearTransition(const QString &serial)
{
    m_tracker.clear(serial);
}

bool UpdateCoordinator::isInTransition(const QString &serial) const
{
    return m_tracker.contains(serial);
}

bool UpdateCoordinator::runTick()
{
    if (m_tickInFlight)
        return false;

    m_tickInFlight = true;
    m_tickPending = false;
    m_scheduler.holdRearm();

    const bool published = executeTick();

    m_tickInFlight = false;
    m_scheduler.releaseRearm();

    if (m_tickPending) {
        m_tickPending = false;
        requestRefresh();
    }
    return published;
}

bool UpdateCoordinator::executeTick()
{
    TickReport report;
    report.startedMs = now();
    Failure failure;

    if (!m_source) {
        setFailure(&failure, FailureKind::Transport, QStringLiteral("No device source configured"));
        failTick(failure, report);
        return false;
    }

    setState(TickState::Authenticating);
    if (!authenticate(&failure) || !withinDeadline(report.startedMs, "authentication", &failure)) {
        failTick(failure, report);
        return false;
    }

    setState(TickState::FetchingRoster);
    DeviceRoster fresh;
    if (!m_source->fetchDevices(&fresh, &failure)) {
        if (!failure.isSet())
            setFailure(&failure, FailureKind::Transport, QStringLiteral("Device roster fetch failed"));
        failTick(failure, report);
        return false;
    }
    if (!withinDeadline(report.startedMs, "roster fetch", &failure)) {
        failTick(failure, report);
        return false;
    }

    setState(TickState::Refreshing);
    if (!refreshRoster(&fresh, report.startedMs, &report, &failure)) {
        failTick(failure, report);
        return false;
    }

    setState(TickState::Publishing);
    if (report.scope == RefreshScope::Full && !report.truncated)
        m_lastFullUpdateMs = report.startedMs;
    m_roster = fresh;
    m_lastReport = report;
    m_lastFailure = Failure();
    if (m_consecutiveFailures > 0) {
        qCInfo(coordinatorLog) << "Update recovered after" << m_consecutiveFailures << "failed ticks";
        m_consecutiveFailures = 0;
        m_scheduler.resetBackoff();
    }

    if (report.truncated) {
        qCWarning(coordinatorLog).noquote() << "Update ran past" << m_options.tickTimeoutMs << "ms, deferred"
                                            << m_deferred.join(QStringLiteral(", ")) << "to the next tick";
    }
    if (!report.failed.isEmpty()) {
        qCWarning(coordinatorLog).noquote() << "Refresh failed for" << report.failed.join(QStringLiteral(", "))
                                            << "- keeping their previous state";
    }
    qCDebug(coordinatorLog) << (report.scope == RefreshScope::Full ? "Full" : "Transition-only")
                            << "update published:" << m_roster.size() << "devices,"
                            << report.refreshed.size() << "refreshed," << m_tracker.size() << "in transition";

    emit rosterPublished(m_roster);
    setState(TickState::Idle);
    return true;
}

bool UpdateCoordinator::authenticate(Failure *failure)
{
    Failure authFailure;
    if (m_source->checkAuth(&authFailure))
        return true;

    if (authFailure.kind == FailureKind::AuthExpiring) {
        qCInfo(coordinatorLog) << "Session expiring, refreshing credentials";
        Failure refreshFailure;
        if (m_source->refreshAuth(&refreshFailure))
            return true;
        if (!refreshFailure.isSet())
            setFailure(&refreshFailure, FailureKind::Auth, QStringLiteral("Session refresh failed"));
        *failure = refreshFailure;
        return false;
    }

    if (!authFailure.isSet())
        setFailure(&authFailure, FailureKind::Auth, QStringLiteral("Session is not valid"));
    *failure = authFailure;
    return false;
}

bool UpdateCoordinator::refreshRoster(DeviceRoster *fresh, std::int64_t startedMs, TickReport *report,
                                      Failure *failure)
{
    const bool full = m_scheduler.currentPeriod() == SchedulerPeriod::Normal
        || !m_lastFullUpdateMs.has_value()
        || startedMs - *m_lastFullUpdateMs >= m_scheduler.normalIntervalMs();
    report->scope = full ? RefreshScope::Full : RefreshScope::TransitionOnly;

    // Serials that left the account are no longer polled.
    const QStringList tracked = m_tracker.serials();
    for (const QString &serial : tracked) {
        if (!findDevice(*fresh, serial)) {
            qCDebug(coordinatorLog).noquote() << "Dropping transition of vanished device" << serial;
            m_tracker.clear(serial);
        }
    }

    // Devices in transition go first, then the ones a previous tick ran
    // out of time for. The published roster keeps the cloud order.
    DeviceRoster order;
    order.reserve(fresh->size());
    const auto rank = [this](const DevicePtr &device) {
        if (m_tracker.contains(device->serial()))
            return 0;
        return m_deferred.contains(device->serial()) ? 1 : 2;
    };
    for (int pass = 0; pass < 3; ++pass) {
        for (const DevicePtr &device : std::as_const(*fresh)) {
            if (device && rank(device) == pass)
                order.push_back(device);
        }
    }

    QStringList deferred;
    for (const DevicePtr &device : std::as_const(order)) {
        const QString serial = device->serial();
        const DevicePtr previous = findDevice(m_roster, serial);

        if (!full && !m_tracker.contains(serial) && previous) {
            device->adoptProperties(*previous);
            continue;
        }

        if (report->truncated || !withinDeadline(startedMs, "device refresh", nullptr)) {
            report->truncated = true;
            deferred.push_back(serial);
            report->failed.push_back(serial);
            if (previous)
                device->adoptProperties(*previous);
            continue;
        }

        Failure deviceFailure;
        if (device->refresh(&deviceFailure)) {
            report->refreshed.push_back(serial);
            if (m_tracker.inspect(*device))
                report->completed.push_back(serial);
        } else {
            if (deviceFailure.kind == FailureKind::Auth) {
                *failure = deviceFailure;
                return false;
            }
            report->failed.push_back(serial);
            if (previous)
                device->adoptProperties(*previous);
        }
    }

    m_deferred = deferred;
    return true;
}

bool UpdateCoordinator::withinDeadline(std::int64_t startedMs, const char *stage, Failure *failure) const
{
    if (m_options.tickTimeoutMs <= 0)
        return true;
    const std::int64_t elapsed = now() - startedMs;
    if (elapsed <= m_options.tickTimeoutMs)
        return true;
    setFailure(failure, FailureKind::Timeout,
               QStringLiteral("Update exceeded %1 ms during %2")
                   .arg(m_options.tickTimeoutMs)
                   .arg(QLatin1String(stage)));
    return false;
}

void UpdateCoordinator::failTick(const Failure &failure, const TickReport &report)
{
    setState(TickState::FailedTick);
    m_lastFailure = failure;
    m_lastReport = report;

    if (failure.kind == FailureKind::Transport || failure.kind == FailureKind::Timeout) {
        ++m_consecutiveFailures;
        m_scheduler.applyBackoff(m_consecutiveFailures);
    }

    qCWarning(coordinatorLog).noquote() << "Update failed (" << failureKindName(failure.kind) << "):"
                                        << failure.message;
    emit updateFailed(failure);
}

void UpdateCoordinator::setState(TickState state)
{
    if (m_state == state)
        return;
    m_state = state;
    qCDebug(coordinatorLog) << "Tick state ->" << tickStateName(state);
}

std::int64_t UpdateCoordinator::now() const
{
    if (m_clock)
        return m_clock();
    return m_elapsed.elapsed();
}

} // namespace phicore::nomaiq
