#include "nomaiq_sidecar.h"

#include <algorithm>
#include <utility>

#include <QDateTime>
#include <QJsonDocument>

#include "nomaiq_commands.h"
#include "nomaiq_logging.h"
#include "nomaiq_probe.h"
#include "nomaiq_schema.h"

namespace phicore::nomaiq {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

QJsonObject parseJsonObject(const std::string &text)
{
    const QByteArray bytes = QByteArray::fromStdString(text);
    if (bytes.trimmed().isEmpty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes);
    return doc.isObject() ? doc.object() : QJsonObject();
}

} // namespace

NomaiqSidecar::NomaiqSidecar()
    : m_http(&m_network)
{
}

NomaiqSidecar::~NomaiqSidecar()
{
    teardownSession(false);
}

void NomaiqSidecar::tick()
{
    if (!m_hasBootstrap)
        return;

    if (m_resetPending) {
        m_resetPending = false;
        teardownSession(false);
    }

    if (m_coordinator)
        return;

    const std::int64_t now = nowMs();
    if (m_nextSignInDueMs > now)
        return;

    QString error;
    if (!connectSession(&error)) {
        setConnectionState(false);
        qCWarning(sidecarLog).noquote() << "Sign-in failed:" << error;
        sendError(error.toStdString());
        m_nextSignInDueMs = now + std::max(1000, m_settings.retryIntervalMs);
    }
}

void NomaiqSidecar::onConnected()
{
    qCInfo(sidecarLog) << "Connected to phi-core";
}

void NomaiqSidecar::onDisconnected()
{
    setConnectionState(false);
    qCInfo(sidecarLog) << "Disconnected from phi-core";
}

void NomaiqSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);

    teardownSession(true);
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;
    m_nextSignInDueMs = 0;

    qCInfo(sidecarLog).noquote() << "Bootstrap adapterId=" << QString::fromStdString(request.adapterId)
                                 << "externalId=" << QString::fromStdString(request.adapter.externalId)
                                 << "user=" << m_settings.credentials.username
                                 << "region=" << m_settings.region;
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));
    if (!m_coordinator)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Not signed in to Ayla cloud"));

    const QString serial = QString::fromStdString(request.deviceExternalId);
    if (const auto light = m_lights.value(serial))
        return invokeLight(*light, request);
    if (const auto door = m_doors.value(serial))
        return invokeDoor(*door, request);

    return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown NomaIQ device"));
}

phicore::adapter::v1::ActionResponse NomaiqSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId == QLatin1String("refresh"))
        return invokeRefresh(request);

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::onDeviceNameUpdate(const sdk::DeviceNameUpdateRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented,
                           QStringLiteral("Renaming is done in the NomaIQ app"));
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::onSceneInvoke(const sdk::SceneInvokeRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("NomaIQ has no scenes"));
}

phicore::adapter::v1::Utf8String NomaiqSidecar::displayName() const
{
    return phicore::nomaiq::displayName();
}

phicore::adapter::v1::Utf8String NomaiqSidecar::description() const
{
    return phicore::nomaiq::description();
}

phicore::adapter::v1::Utf8String NomaiqSidecar::iconSvg() const
{
    return phicore::nomaiq::iconSvg();
}

phicore::adapter::v1::Utf8String NomaiqSidecar::apiVersion() const
{
    return "1.0.0";
}

int NomaiqSidecar::timeoutMs() const
{
    return m_settings.tickTimeoutMs;
}

phicore::adapter::v1::AdapterCapabilities NomaiqSidecar::capabilities() const
{
    return phicore::nomaiq::capabilities();
}

phicore::adapter::v1::JsonText NomaiqSidecar::configSchemaJson() const
{
    return phicore::nomaiq::configSchemaJson();
}

std::int64_t NomaiqSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

void NomaiqSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;
    m_meta = parseJsonObject(adapter.metaJson);
    m_settings = parseAdapterSettings(m_meta, QString::fromStdString(adapter.token));
}

bool NomaiqSidecar::connectSession(QString *error)
{
    if (!m_settings.credentials.isComplete()) {
        if (error)
            *error = QStringLiteral("NomaIQ credentials incomplete: username, password, client id and secret are required");
        return false;
    }

    auto session = std::make_unique<AylaSession>(&m_http,
                                                 hostsForRegion(m_settings.region),
                                                 m_settings.credentials,
                                                 m_settings.requestTimeoutMs);
    Failure failure;
    if (!session->signIn(&failure)) {
        if (error) {
            *error = failure.kind == FailureKind::Auth
                ? QStringLiteral("Authentication failed, re-enter credentials: %1").arg(failure.message)
                : failure.message;
        }
        return false;
    }

    CoordinatorOptions options;
    options.normalIntervalMs = m_settings.pollIntervalMs;
    options.fastIntervalMs = m_settings.transitionIntervalMs;
    options.maxBackoffMs = m_settings.retryIntervalMs;
    options.tickTimeoutMs = m_settings.tickTimeoutMs;

    m_session = std::move(session);
    m_coordinator = std::make_unique<UpdateCoordinator>(m_session.get(), options);

    QObject::connect(m_coordinator.get(), &UpdateCoordinator::rosterPublished, m_coordinator.get(),
                     [this](const DeviceRoster &roster) { handleRosterPublished(roster); });
    QObject::connect(m_coordinator.get(), &UpdateCoordinator::updateFailed, m_coordinator.get(),
                     [this](const Failure &failure) { handleUpdateFailed(failure); });

    m_coordinator->start();
    return true;
}

void NomaiqSidecar::teardownSession(bool signOut)
{
    m_lights.clear();
    m_doors.clear();
    if (m_coordinator) {
        m_coordinator->stop();
        m_coordinator.reset();
    }
    if (m_session) {
        if (signOut)
            m_session->signOut();
        m_session.reset();
    }
}

void NomaiqSidecar::handleRosterPublished(const DeviceRoster &roster)
{
    QSet<QString> current;
    QString error;

    for (const DevicePtr &device : roster) {
        if (!device)
            continue;
        const QString serial = device->serial();

        if (isLightDevice(*device)) {
            auto &light = m_lights[serial];
            if (!light)
                light = std::make_shared<LightController>(m_coordinator.get(), serial);
            light->reconcile();
            current.insert(serial);
            if (!publishEntry(buildLightEntry(*light, *device), &error))
                break;
        } else if (isGarageDoorDevice(*device)) {
            auto &door = m_doors[serial];
            if (!door)
                door = std::make_shared<GarageDoorController>(m_coordinator.get(), serial);
            door->reconcile();
            current.insert(serial);
            if (!publishEntry(buildGarageDoorEntry(*door, *device), &error))
                break;
        }
    }

    if (!error.isEmpty()) {
        qCWarning(sidecarLog).noquote() << "Publishing devices failed:" << error;
        return;
    }

    v1::Utf8String sdkError;
    for (const QString &serial : std::as_const(m_knownDevices)) {
        if (current.contains(serial))
            continue;
        m_lights.remove(serial);
        m_doors.remove(serial);
        if (!sendDeviceRemoved(serial.toStdString(), &sdkError))
            qCWarning(sidecarLog).noquote() << "deviceRemoved failed:" << QString::fromStdString(sdkError);
    }
    m_knownDevices = current;

    setConnectionState(true);
    if (!sendFullSyncCompleted(&sdkError))
        qCWarning(sidecarLog).noquote() << "fullSyncCompleted failed:" << QString::fromStdString(sdkError);
}

void NomaiqSidecar::handleUpdateFailed(const Failure &failure)
{
    setConnectionState(false);

    QString message = failure.message;
    if (failure.kind == FailureKind::Auth) {
        message = QStringLiteral("Authentication failed, re-enter credentials: %1").arg(failure.message);
        // Sign in again from scratch once the retry interval has passed.
        m_resetPending = true;
        m_nextSignInDueMs = nowMs() + std::max(1000, m_settings.retryIntervalMs);
    }
    sendError(message.toStdString());
}

bool NomaiqSidecar::publishEntry(const DeviceEntry &entry, QString *error)
{
    v1::Utf8String sdkError;
    if (!sendDeviceUpdated(entry.device, entry.channels, &sdkError)) {
        if (error)
            *error = QString::fromStdString(sdkError);
        return false;
    }

    const std::int64_t ts = nowMs();
    for (const v1::Channel &channel : entry.channels) {
        if (!channel.hasValue)
            continue;
        if (!sendChannelStateUpdated(entry.device.externalId, channel.externalId, channel.lastValue, ts, &sdkError)) {
            if (error)
                *error = QString::fromStdString(sdkError);
            return false;
        }
    }
    return true;
}

bool NomaiqSidecar::publishDevice(const QString &serial, QString *error)
{
    const DevicePtr device = m_coordinator ? m_coordinator->device(serial) : DevicePtr();
    if (!device)
        return true;
    if (const auto light = m_lights.value(serial))
        return publishEntry(buildLightEntry(*light, *device), error);
    if (const auto door = m_doors.value(serial))
        return publishEntry(buildGarageDoorEntry(*door, *device), error);
    return true;
}

void NomaiqSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error))
        qCWarning(sidecarLog).noquote() << "connectionStateChanged failed:" << QString::fromStdString(error);
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::invokeLight(LightController &light,
                                                             const sdk::ChannelInvokeRequest &request)
{
    LightCommand command;
    QString parseError;
    if (!buildLightCommand(QString::fromStdString(request.channelExternalId), requestScalar(request), light, &command,
                           &parseError))
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, parseError);

    Failure failure;
    const bool ok = command.turnOff ? light.turnOff(&failure) : light.turnOn(command.turnOn, &failure);

    QString publishError;
    if (!publishDevice(light.serial(), &publishError))
        qCWarning(sidecarLog).noquote() << "Publishing light state failed:" << publishError;

    if (!ok)
        return failureResponse(request.cmdId, CmdStatus::Failure, failure.message);

    CmdResponse resp = successResponse(request.cmdId);
    if (request.hasScalarValue)
        resp.finalValue = request.value;
    return resp;
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::invokeDoor(GarageDoorController &door,
                                                            const sdk::ChannelInvokeRequest &request)
{
    DoorCommand command = DoorCommand::Stop;
    QString parseError;
    if (!parseDoorCommand(QString::fromStdString(request.channelExternalId), requestScalar(request),
                          QByteArray::fromStdString(request.valueJson), &command, &parseError))
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, parseError);

    Failure failure;
    bool ok = false;
    switch (command) {
    case DoorCommand::Open:
        ok = door.open(&failure);
        break;
    case DoorCommand::Close:
        ok = door.close(&failure);
        break;
    case DoorCommand::Stop:
        ok = door.stop(&failure);
        break;
    }

    if (!ok)
        return failureResponse(request.cmdId, CmdStatus::Failure, failure.message);
    return successResponse(request.cmdId);
}

phicore::adapter::v1::ActionResponse NomaiqSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    const AdapterSettings settings = mergeAdapterSettings(m_settings, parseJsonObject(request.paramsJson));
    const ProbeResult probe = runProbe(m_http, settings);
    if (!probe.ok) {
        response.status = CmdStatus::Failure;
        response.error = probe.error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = probe.message.toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse NomaiqSidecar::invokeRefresh(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();
    response.resultType = v1::ActionResultType::None;

    if (!m_coordinator || !m_coordinator->isRunning()) {
        response.status = CmdStatus::TemporarilyOffline;
        response.error = "Not connected to the Ayla cloud";
        return response;
    }

    for (const auto &light : std::as_const(m_lights))
        light->update();
    for (const auto &door : std::as_const(m_doors))
        door->update();
    // Covers an account without entities yet.
    m_coordinator->requestRefresh();

    response.status = CmdStatus::Success;
    return response;
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse NomaiqSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::nomaiq
