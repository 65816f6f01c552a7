#pragma once

#include <QDateTime>
#include <QList>
#include <QString>

#include "nomaiq_config.h"
#include "nomaiq_device.h"
#include "nomaiq_http.h"
#include "nomaiq_source.h"

namespace phicore::nomaiq {

struct AylaTokens {
    QString accessToken;
    QString refreshToken;
    QDateTime expiresAt;
};

struct AylaDeviceInfo {
    QString dsn;
    QString productName;
    QString oemModel;
};

namespace ayla {

// Tokens closer than this to expiry are refreshed before the next tick.
inline constexpr int kAuthRefreshMarginSecs = 600;

QByteArray buildSignInPayload(const AylaCredentials &credentials);
QByteArray buildRefreshPayload(const QString &refreshToken);
QByteArray buildSignOutPayload(const QString &accessToken);
QByteArray buildDatapointPayload(const PropertyValue &value);

bool parseTokens(const QByteArray &payload, const QDateTime &now, AylaTokens *tokens, QString *error = nullptr);
bool parseDeviceList(const QByteArray &payload, QList<AylaDeviceInfo> *devices, QString *error = nullptr);
bool parseProperties(const QByteArray &payload, PropertyMap *properties, QString *error = nullptr);
QString extractAylaError(const QByteArray &payload);

// FailureKind::None while usable, AuthExpiring inside the refresh margin,
// Auth when missing or expired.
FailureKind tokenState(const AylaTokens &tokens, const QDateTime &now);

} // namespace ayla

// Signed-in Ayla cloud session for one account. Serves as the device source
// of the update coordinator.
class AylaSession final : public DeviceSource
{
public:
    AylaSession(HttpClient *http,
                AylaHosts hosts,
                AylaCredentials credentials,
                int timeoutMs = kDefaultRequestTimeoutMs);

    bool signIn(Failure *failure = nullptr);
    void signOut();
    bool isSignedIn() const;

    bool checkAuth(Failure *failure = nullptr) override;
    bool refreshAuth(Failure *failure = nullptr) override;
    bool fetchDevices(DeviceRoster *devices, Failure *failure = nullptr) override;

    bool fetchProperties(const QString &dsn, PropertyMap *properties, Failure *failure = nullptr);
    bool writeProperty(const QString &dsn, const QString &name, const PropertyValue &value, Failure *failure = nullptr);

private:
    bool storeTokens(const HttpResult &result, const QString &operation, Failure *failure);
    void reportHttpFailure(const HttpResult &result, const QString &operation, FailureKind fallbackKind,
                           Failure *failure) const;

    HttpClient *m_http = nullptr;
    AylaHosts m_hosts;
    AylaCredentials m_credentials;
    int m_timeoutMs = kDefaultRequestTimeoutMs;
    AylaTokens m_tokens;
};

// Roster entry backed by the Ayla session that listed it. The session must
// outlive every device it creates.
class AylaDevice final : public Device
{
public:
    AylaDevice(AylaSession *session, const AylaDeviceInfo &info);

    bool refresh(Failure *failure = nullptr) override;
    bool setProperty(const QString &name, const PropertyValue &value, Failure *failure = nullptr) override;

private:
    AylaSession *m_session = nullptr;
};

} // namespace phicore::nomaiq
