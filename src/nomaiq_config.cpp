#include "nomaiq_config.h"

#include <algorithm>

#include <QVariant>

namespace phicore::nomaiq {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    if (!obj.contains(key))
        return fallback;
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

void applyObject(AdapterSettings *settings, const QJsonObject &obj)
{
    AylaCredentials &creds = settings->credentials;
    creds.username = readString(obj, QStringLiteral("username"), creds.username);
    creds.password = readString(obj, QStringLiteral("password"), creds.password);
    creds.clientId = readString(obj, QStringLiteral("clientId"), creds.clientId);
    creds.clientSecret = readString(obj, QStringLiteral("clientSecret"), creds.clientSecret);

    settings->region = readString(obj, QStringLiteral("region"), settings->region).toLower();

    settings->pollIntervalMs = std::clamp(
        readInt(obj, QStringLiteral("pollIntervalMs"), settings->pollIntervalMs), 5000, 600000);
    settings->transitionIntervalMs = std::clamp(
        readInt(obj, QStringLiteral("transitionIntervalMs"), settings->transitionIntervalMs), 500, 60000);
    settings->retryIntervalMs = std::clamp(
        readInt(obj, QStringLiteral("retryIntervalMs"), settings->retryIntervalMs), 1000, 3600000);
    settings->requestTimeoutMs = std::clamp(
        readInt(obj, QStringLiteral("requestTimeoutMs"), settings->requestTimeoutMs), 1000, 60000);
    settings->tickTimeoutMs = std::clamp(
        readInt(obj, QStringLiteral("tickTimeoutMs"), settings->tickTimeoutMs), 1000, 300000);

    // The fast cadence never exceeds the normal one.
    settings->transitionIntervalMs = std::min(settings->transitionIntervalMs, settings->pollIntervalMs);
}

} // namespace

bool AylaCredentials::isComplete() const
{
    return !username.isEmpty() && !password.isEmpty() && !clientId.isEmpty() && !clientSecret.isEmpty();
}

AdapterSettings parseAdapterSettings(const QJsonObject &meta, const QString &token)
{
    AdapterSettings settings;
    settings.credentials.password = token.trimmed();
    applyObject(&settings, meta);
    return settings;
}

AdapterSettings mergeAdapterSettings(const AdapterSettings &base, const QJsonObject &overrides)
{
    AdapterSettings settings = base;
    applyObject(&settings, overrides);
    return settings;
}

AylaHosts hostsForRegion(const QString &region)
{
    const QString normalized = region.trimmed().toLower();
    if (normalized == QLatin1String("eu")) {
        return {QStringLiteral("https://user-field-eu.aylanetworks.com"),
                QStringLiteral("https://ads-eu.aylanetworks.com")};
    }
    if (normalized == QLatin1String("cn")) {
        return {QStringLiteral("https://user-field.ayla.com.cn"),
                QStringLiteral("https://ads-field.ayla.com.cn")};
    }
    return {QStringLiteral("https://user-field.aylanetworks.com"),
            QStringLiteral("https://ads-field.aylanetworks.com")};
}

} // namespace phicore::nomaiq
