#pragma once

#include <QJsonObject>
#include <QString>

namespace phicore::nomaiq {

inline constexpr int kDefaultPollIntervalMs = 30000;
inline constexpr int kDefaultTransitionIntervalMs = 2000;
inline constexpr int kDefaultRetryIntervalMs = 300000;
inline constexpr int kDefaultRequestTimeoutMs = 10000;
inline constexpr int kDefaultTickTimeoutMs = 20000;

struct AylaHosts {
    QString userBaseUrl;
    QString adsBaseUrl;
};

struct AylaCredentials {
    QString username;
    QString password;
    QString clientId;
    QString clientSecret;

    bool isComplete() const;
};

struct AdapterSettings {
    AylaCredentials credentials;
    QString region = QStringLiteral("us");
    int pollIntervalMs = kDefaultPollIntervalMs;
    int transitionIntervalMs = kDefaultTransitionIntervalMs;
    int retryIntervalMs = kDefaultRetryIntervalMs;
    int requestTimeoutMs = kDefaultRequestTimeoutMs;
    int tickTimeoutMs = kDefaultTickTimeoutMs;
};

// Reads the adapter meta JSON. The bootstrap token is used as password when
// the meta carries none.
AdapterSettings parseAdapterSettings(const QJsonObject &meta, const QString &token = QString());

// Applies probe parameters (same keys as the meta) on top of existing settings.
AdapterSettings mergeAdapterSettings(const AdapterSettings &base, const QJsonObject &overrides);

AylaHosts hostsForRegion(const QString &region);

} // namespace phicore::nomaiq
