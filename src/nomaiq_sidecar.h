#pragma once

#include <cstdint>
#include <memory>

#include <QHash>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QSet>
#include <QString>

#include "garage_door_controller.h"
#include "light_controller.h"
#include "nomaiq_ayla.h"
#include "nomaiq_config.h"
#include "nomaiq_http.h"
#include "nomaiq_model.h"
#include "update_coordinator.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::nomaiq {

class NomaiqSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    NomaiqSidecar();
    ~NomaiqSidecar() override;

    void tick();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;
    phicore::adapter::v1::CmdResponse onDeviceNameUpdate(
        const phicore::adapter::sdk::DeviceNameUpdateRequest &request) override;
    phicore::adapter::v1::CmdResponse onSceneInvoke(
        const phicore::adapter::sdk::SceneInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    static std::int64_t nowMs();

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);

    bool connectSession(QString *error = nullptr);
    void teardownSession(bool signOut);

    void handleRosterPublished(const DeviceRoster &roster);
    void handleUpdateFailed(const Failure &failure);
    bool publishEntry(const DeviceEntry &entry, QString *error = nullptr);
    bool publishDevice(const QString &serial, QString *error = nullptr);
    void setConnectionState(bool connected);

    CmdResponse invokeLight(LightController &light, const phicore::adapter::sdk::ChannelInvokeRequest &request);
    CmdResponse invokeDoor(GarageDoorController &door, const phicore::adapter::sdk::ChannelInvokeRequest &request);
    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRefresh(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;

    phicore::adapter::v1::Adapter m_adapterInfo;
    QJsonObject m_meta;
    AdapterSettings m_settings;

    // Declaration order is teardown order in reverse: controllers go
    // before the coordinator, the coordinator's roster before the session.
    std::unique_ptr<AylaSession> m_session;
    std::unique_ptr<UpdateCoordinator> m_coordinator;
    QHash<QString, std::shared_ptr<LightController>> m_lights;
    QHash<QString, std::shared_ptr<GarageDoorController>> m_doors;
    QSet<QString> m_knownDevices;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    bool m_resetPending = false;
    std::int64_t m_nextSignInDueMs = 0;
};

} // namespace phicore::nomaiq
