#include "nomaiq_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace phicore::nomaiq {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpResult HttpClient::get(const QString &url, const QString &authToken, int timeoutMs) const
{
    return request(QByteArrayLiteral("GET"), url, {}, authToken, timeoutMs);
}

HttpResult HttpClient::postJson(const QString &url,
                                const QByteArray &payload,
                                const QString &authToken,
                                int timeoutMs) const
{
    return request(QByteArrayLiteral("POST"), url, payload, authToken, timeoutMs);
}

bool HttpClient::buildRequest(const QString &url,
                              const QString &authToken,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    const QUrl parsed(url);
    if (!parsed.isValid() || parsed.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid request URL: %1").arg(url);
        return false;
    }

    QNetworkRequest out(parsed);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "phi-adapter-nomaiq/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!authToken.isEmpty())
        out.setRawHeader("Authorization", QByteArrayLiteral("auth_token ") + authToken.toUtf8());

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const QByteArray &method,
                               const QString &url,
                               const QByteArray &payload,
                               const QString &authToken,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(url, authToken, !payload.isEmpty(), &requestObj, &result.error))
        return result;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(requestObj);
    else if (method == QByteArrayLiteral("POST"))
        reply = m_manager->post(requestObj, payload);
    else
        reply = m_manager->sendCustomRequest(requestObj, method, payload);

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : 10000);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (result.statusCode >= 200 && result.statusCode < 300 && reply->error() == QNetworkReply::NoError) {
        result.ok = true;
    } else if (result.statusCode > 0) {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    } else {
        result.error = reply->errorString();
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::nomaiq
