#pragma once

#include <QByteArray>
#include <QString>

class QNetworkAccessManager;
class QNetworkRequest;

namespace phicore::nomaiq {

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;

    bool isAuthRejected() const noexcept { return statusCode == 401 || statusCode == 403; }
};

// Blocking JSON client for the Ayla cloud. Requests spin a local event loop
// until the reply finishes or the timeout elapses.
class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const QString &url,
                   const QString &authToken = QString(),
                   int timeoutMs = 10000) const;

    HttpResult postJson(const QString &url,
                        const QByteArray &payload,
                        const QString &authToken = QString(),
                        int timeoutMs = 10000) const;

private:
    bool buildRequest(const QString &url,
                      const QString &authToken,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const QByteArray &method,
                       const QString &url,
                       const QByteArray &payload,
                       const QString &authToken,
                       int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::nomaiq
