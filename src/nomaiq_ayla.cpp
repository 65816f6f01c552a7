#include "nomaiq_ayla.h"

#include <cmath>
#include <utility>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

#include "nomaiq_logging.h"

namespace phicore::nomaiq {

namespace ayla {

QByteArray buildSignInPayload(const AylaCredentials &credentials)
{
    QJsonObject application;
    application.insert(QStringLiteral("app_id"), credentials.clientId);
    application.insert(QStringLiteral("app_secret"), credentials.clientSecret);

    QJsonObject user;
    user.insert(QStringLiteral("email"), credentials.username);
    user.insert(QStringLiteral("password"), credentials.password);
    user.insert(QStringLiteral("application"), application);

    QJsonObject root;
    root.insert(QStringLiteral("user"), user);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray buildRefreshPayload(const QString &refreshToken)
{
    QJsonObject user;
    user.insert(QStringLiteral("refresh_token"), refreshToken);
    QJsonObject root;
    root.insert(QStringLiteral("user"), user);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray buildSignOutPayload(const QString &accessToken)
{
    QJsonObject user;
    user.insert(QStringLiteral("access_token"), accessToken);
    QJsonObject root;
    root.insert(QStringLiteral("user"), user);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray buildDatapointPayload(const PropertyValue &value)
{
    QJsonValue jsonValue;
    if (const auto *b = std::get_if<bool>(&value))
        jsonValue = *b ? 1 : 0;
    else if (const auto *i = std::get_if<std::int64_t>(&value))
        jsonValue = static_cast<qint64>(*i);
    else
        jsonValue = std::get<QString>(value);

    QJsonObject datapoint;
    datapoint.insert(QStringLiteral("value"), jsonValue);
    QJsonObject root;
    root.insert(QStringLiteral("datapoint"), datapoint);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool parseTokens(const QByteArray &payload, const QDateTime &now, AylaTokens *tokens, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Unexpected sign-in response from Ayla cloud");
        return false;
    }

    const QJsonObject obj = doc.object();
    const QString accessToken = obj.value(QStringLiteral("access_token")).toString().trimmed();
    if (accessToken.isEmpty()) {
        if (error)
            *error = QStringLiteral("Ayla cloud returned no access token");
        return false;
    }

    const int expiresIn = obj.value(QStringLiteral("expires_in")).toInt(0);
    if (tokens) {
        tokens->accessToken = accessToken;
        tokens->refreshToken = obj.value(QStringLiteral("refresh_token")).toString().trimmed();
        tokens->expiresAt = now.addSecs(expiresIn > 0 ? expiresIn : 0);
    }
    if (error)
        error->clear();
    return true;
}

bool parseDeviceList(const QByteArray &payload, QList<AylaDeviceInfo> *devices, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isArray()) {
        if (error)
            *error = QStringLiteral("Unexpected device list from Ayla cloud");
        return false;
    }

    QList<AylaDeviceInfo> out;
    const QJsonArray arr = doc.array();
    for (const QJsonValue &value : arr) {
        const QJsonObject deviceObj = value.toObject().value(QStringLiteral("device")).toObject();
        const QString dsn = deviceObj.value(QStringLiteral("dsn")).toString().trimmed();
        if (dsn.isEmpty())
            continue;

        AylaDeviceInfo info;
        info.dsn = dsn;
        info.productName = deviceObj.value(QStringLiteral("product_name")).toString().trimmed();
        info.oemModel = deviceObj.value(QStringLiteral("oem_model")).toString().trimmed();
        if (info.productName.isEmpty())
            info.productName = dsn;
        out.push_back(info);
    }

    if (devices)
        *devices = out;
    if (error)
        error->clear();
    return true;
}

bool parseProperties(const QByteArray &payload, PropertyMap *properties, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isArray()) {
        if (error)
            *error = QStringLiteral("Unexpected property list from Ayla cloud");
        return false;
    }

    PropertyMap out;
    const QJsonArray arr = doc.array();
    for (const QJsonValue &entry : arr) {
        const QJsonObject propObj = entry.toObject().value(QStringLiteral("property")).toObject();
        const QString name = propObj.value(QStringLiteral("name")).toString();
        if (name.isEmpty())
            continue;

        const QJsonValue raw = propObj.value(QStringLiteral("value"));
        const QString baseType = propObj.value(QStringLiteral("base_type")).toString();

        // Properties that never reported a value stay absent.
        if (raw.isNull() || raw.isUndefined())
            continue;

        if (raw.isBool()) {
            out.insert(name, PropertyValue(static_cast<std::int64_t>(raw.toBool() ? 1 : 0)));
        } else if (raw.isDouble()) {
            out.insert(name, PropertyValue(static_cast<std::int64_t>(std::llround(raw.toDouble()))));
        } else if (raw.isString()) {
            const QString text = raw.toString();
            if (baseType == QLatin1String("integer") || baseType == QLatin1String("boolean")) {
                bool ok = false;
                const qlonglong parsed = text.trimmed().toLongLong(&ok);
                if (ok) {
                    out.insert(name, PropertyValue(static_cast<std::int64_t>(parsed)));
                    continue;
                }
            }
            out.insert(name, PropertyValue(text));
        }
    }

    if (properties)
        *properties = out;
    if (error)
        error->clear();
    return true;
}

QString extractAylaError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject())
        return {};

    const QJsonObject obj = doc.object();
    const QJsonValue errorValue = obj.value(QStringLiteral("error"));
    if (errorValue.isString())
        return errorValue.toString();

    const QJsonValue errorsValue = obj.value(QStringLiteral("errors"));
    if (errorsValue.isString())
        return errorsValue.toString();
    if (errorsValue.isObject()) {
        const QJsonObject errors = errorsValue.toObject();
        for (auto it = errors.begin(); it != errors.end(); ++it) {
            QJsonValue first = it.value();
            if (first.isArray()) {
                const QJsonArray messages = first.toArray();
                if (messages.isEmpty())
                    continue;
                first = messages.at(0);
            }
            if (first.isString())
                return QStringLiteral("%1 %2").arg(it.key(), first.toString());
        }
    }
    return {};
}

FailureKind tokenState(const AylaTokens &tokens, const QDateTime &now)
{
    if (tokens.accessToken.isEmpty() || !tokens.expiresAt.isValid())
        return FailureKind::Auth;
    const qint64 remaining = now.secsTo(tokens.expiresAt);
    if (remaining <= 0)
        return FailureKind::Auth;
    if (remaining < kAuthRefreshMarginSecs)
        return FailureKind::AuthExpiring;
    return FailureKind::None;
}

} // namespace ayla

AylaSession::AylaSession(HttpClient *http, AylaHosts hosts, AylaCredentials credentials, int timeoutMs)
    : m_http(http)
    , m_hosts(std::move(hosts))
    , m_credentials(std::move(credentials))
    , m_timeoutMs(timeoutMs)
{
}

bool AylaSession::signIn(Failure *failure)
{
    if (!m_credentials.isComplete()) {
        setFailure(failure, FailureKind::Auth, QStringLiteral("Ayla credentials are incomplete"));
        return false;
    }
    if (!m_http) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("HTTP client unavailable"));
        return false;
    }

    const HttpResult result = m_http->postJson(m_hosts.userBaseUrl + QStringLiteral("/users/sign_in.json"),
                                               ayla::buildSignInPayload(m_credentials),
                                               QString(),
                                               m_timeoutMs);
    if (!storeTokens(result, QStringLiteral("sign-in"), failure))
        return false;

    qCInfo(aylaLog).noquote() << "Signed in to Ayla cloud as" << m_credentials.username;
    return true;
}

void AylaSession::signOut()
{
    if (m_tokens.accessToken.isEmpty() || !m_http)
        return;

    const HttpResult result = m_http->postJson(m_hosts.userBaseUrl + QStringLiteral("/users/sign_out.json"),
                                               ayla::buildSignOutPayload(m_tokens.accessToken),
                                               m_tokens.accessToken,
                                               m_timeoutMs);
    if (!result.ok)
        qCWarning(aylaLog).noquote() << "Ayla sign-out failed:" << result.error;
    m_tokens = {};
}

bool AylaSession::isSignedIn() const
{
    return !m_tokens.accessToken.isEmpty();
}

bool AylaSession::checkAuth(Failure *failure)
{
    const FailureKind state = ayla::tokenState(m_tokens, QDateTime::currentDateTimeUtc());
    switch (state) {
    case FailureKind::None:
        return true;
    case FailureKind::AuthExpiring:
        setFailure(failure, state, QStringLiteral("Ayla access token expires soon"));
        return false;
    default:
        setFailure(failure, FailureKind::Auth,
                   isSignedIn() ? QStringLiteral("Ayla access token expired")
                                : QStringLiteral("Not signed in to Ayla cloud"));
        return false;
    }
}

bool AylaSession::refreshAuth(Failure *failure)
{
    if (m_tokens.refreshToken.isEmpty()) {
        // No refresh token: fall back to a fresh sign-in.
        return signIn(failure);
    }
    if (!m_http) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("HTTP client unavailable"));
        return false;
    }

    const HttpResult result = m_http->postJson(m_hosts.userBaseUrl + QStringLiteral("/users/refresh_token.json"),
                                               ayla::buildRefreshPayload(m_tokens.refreshToken),
                                               QString(),
                                               m_timeoutMs);
    if (!storeTokens(result, QStringLiteral("token refresh"), failure))
        return false;

    qCDebug(aylaLog) << "Ayla access token refreshed";
    return true;
}

bool AylaSession::fetchDevices(DeviceRoster *devices, Failure *failure)
{
    if (!m_http) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("HTTP client unavailable"));
        return false;
    }

    const HttpResult result = m_http->get(m_hosts.adsBaseUrl + QStringLiteral("/apiv1/devices.json"),
                                          m_tokens.accessToken,
                                          m_timeoutMs);
    if (!result.ok) {
        reportHttpFailure(result, QStringLiteral("device list"), FailureKind::Transport, failure);
        return false;
    }

    QList<AylaDeviceInfo> infos;
    QString parseError;
    if (!ayla::parseDeviceList(result.payload, &infos, &parseError)) {
        setFailure(failure, FailureKind::InvalidData, parseError);
        return false;
    }

    DeviceRoster roster;
    roster.reserve(infos.size());
    for (const AylaDeviceInfo &info : std::as_const(infos))
        roster.push_back(std::make_shared<AylaDevice>(this, info));

    qCDebug(aylaLog) << "Ayla cloud listed" << roster.size() << "devices";
    if (devices)
        *devices = roster;
    return true;
}

bool AylaSession::fetchProperties(const QString &dsn, PropertyMap *properties, Failure *failure)
{
    if (!m_http) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("HTTP client unavailable"));
        return false;
    }

    const QString url = QStringLiteral("%1/apiv1/dsns/%2/properties.json")
                            .arg(m_hosts.adsBaseUrl, QString::fromUtf8(QUrl::toPercentEncoding(dsn)));
    const HttpResult result = m_http->get(url, m_tokens.accessToken, m_timeoutMs);
    if (!result.ok) {
        reportHttpFailure(result, QStringLiteral("properties of %1").arg(dsn), FailureKind::Transport, failure);
        return false;
    }

    QString parseError;
    if (!ayla::parseProperties(result.payload, properties, &parseError)) {
        setFailure(failure, FailureKind::InvalidData, QStringLiteral("%1: %2").arg(dsn, parseError));
        return false;
    }
    return true;
}

bool AylaSession::writeProperty(const QString &dsn, const QString &name, const PropertyValue &value,
                                Failure *failure)
{
    if (!m_http) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("HTTP client unavailable"));
        return false;
    }

    const QString url = QStringLiteral("%1/apiv1/dsns/%2/properties/%3/datapoints.json")
                            .arg(m_hosts.adsBaseUrl,
                                 QString::fromUtf8(QUrl::toPercentEncoding(dsn)),
                                 QString::fromUtf8(QUrl::toPercentEncoding(name)));
    const HttpResult result = m_http->postJson(url, ayla::buildDatapointPayload(value),
                                               m_tokens.accessToken, m_timeoutMs);
    if (!result.ok) {
        reportHttpFailure(result, QStringLiteral("write %1.%2").arg(dsn, name), FailureKind::Command, failure);
        return false;
    }

    qCDebug(aylaLog).noquote() << "Wrote" << name << "=" << propertyToString(value) << "to" << dsn;
    return true;
}

bool AylaSession::storeTokens(const HttpResult &result, const QString &operation, Failure *failure)
{
    if (!result.ok) {
        // Rejected credentials on sign-in or refresh end the session.
        if (result.isAuthRejected())
            m_tokens = {};
        reportHttpFailure(result, operation, FailureKind::Transport, failure);
        return false;
    }

    AylaTokens tokens;
    QString parseError;
    if (!ayla::parseTokens(result.payload, QDateTime::currentDateTimeUtc(), &tokens, &parseError)) {
        setFailure(failure, FailureKind::InvalidData, parseError);
        return false;
    }
    if (tokens.refreshToken.isEmpty())
        tokens.refreshToken = m_tokens.refreshToken;
    m_tokens = tokens;
    return true;
}

void AylaSession::reportHttpFailure(const HttpResult &result, const QString &operation,
                                    FailureKind fallbackKind, Failure *failure) const
{
    QString detail = ayla::extractAylaError(result.payload);
    if (detail.isEmpty())
        detail = result.error;

    const FailureKind kind = result.isAuthRejected() ? FailureKind::Auth : fallbackKind;
    const QString message = QStringLiteral("Ayla %1 failed: %2").arg(operation, detail);
    qCWarning(aylaLog).noquote() << message;
    setFailure(failure, kind, message);
}

AylaDevice::AylaDevice(AylaSession *session, const AylaDeviceInfo &info)
    : Device(info.dsn, info.productName, info.oemModel)
    , m_session(session)
{
}

bool AylaDevice::refresh(Failure *failure)
{
    if (!m_session) {
        setFailure(failure, FailureKind::Transport, QStringLiteral("Device %1 has no session").arg(serial()));
        return false;
    }

    PropertyMap properties;
    if (!m_session->fetchProperties(serial(), &properties, failure))
        return false;
    replaceProperties(std::move(properties));
    return true;
}

bool AylaDevice::setProperty(const QString &name, const PropertyValue &value, Failure *failure)
{
    if (!m_session) {
        setFailure(failure, FailureKind::Command, QStringLiteral("Device %1 has no session").arg(serial()));
        return false;
    }
    return m_session->writeProperty(serial(), name, value, failure);
}

} // namespace phicore::nomaiq
