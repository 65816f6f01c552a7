#pragma once

#include <cstring>
#include <utility>

#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QStringList>
#include <QTimer>

namespace phicore::nomaiq::test {

// Reply with a fixed status and body. It finishes on the next event loop
// iteration, as a real reply does.
class CannedReply final : public QNetworkReply
{
public:
    CannedReply(const QNetworkRequest &request,
                QNetworkAccessManager::Operation operation,
                int statusCode,
                QByteArray body,
                QObject *parent)
        : QNetworkReply(parent)
        , m_body(std::move(body))
    {
        setRequest(request);
        setUrl(request.url());
        setOperation(operation);
        setAttribute(QNetworkRequest::HttpStatusCodeAttribute, statusCode);
        if (statusCode == 401)
            setError(AuthenticationRequiredError, QStringLiteral("Unauthorized"));
        else if (statusCode == 403)
            setError(ContentAccessDenied, QStringLiteral("Forbidden"));
        else if (statusCode >= 400)
            setError(UnknownServerError, QStringLiteral("Server error"));
        open(QIODevice::ReadOnly | QIODevice::Unbuffered);

        QTimer::singleShot(0, this, [this]() {
            setFinished(true);
            emit finished();
        });
    }

    void abort() override {}
    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override { return m_body.size() - m_offset + QIODevice::bytesAvailable(); }

protected:
    qint64 readData(char *data, qint64 maxSize) override
    {
        const qint64 count = qMin(maxSize, qint64(m_body.size()) - m_offset);
        if (count <= 0)
            return m_offset >= m_body.size() ? -1 : 0;
        std::memcpy(data, m_body.constData() + m_offset, size_t(count));
        m_offset += count;
        return count;
    }

private:
    QByteArray m_body;
    qint64 m_offset = 0;
};

struct RecordedRequest {
    QNetworkAccessManager::Operation operation = QNetworkAccessManager::GetOperation;
    QString path;
    QByteArray body;
    QByteArray authorization;
};

// Serves canned responses by URL path and records every request. Several
// responses for one path are served in order; the last one repeats.
// Unknown paths answer 404.
class FakeNetworkManager final : public QNetworkAccessManager
{
public:
    void respond(const QString &path, int statusCode, const QByteArray &body)
    {
        m_responses[path].push_back({statusCode, body});
    }

    const QList<RecordedRequest> &requests() const { return m_requests; }

    QStringList paths() const
    {
        QStringList out;
        for (const RecordedRequest &request : m_requests)
            out.push_back(request.path);
        return out;
    }

protected:
    QNetworkReply *createRequest(Operation operation, const QNetworkRequest &request,
                                 QIODevice *outgoingData = nullptr) override
    {
        RecordedRequest recorded;
        recorded.operation = operation;
        recorded.path = request.url().path();
        recorded.authorization = request.rawHeader("Authorization");
        if (outgoingData)
            recorded.body = outgoingData->readAll();
        m_requests.push_back(recorded);

        Canned canned{404, QByteArray()};
        auto it = m_responses.find(recorded.path);
        if (it != m_responses.end() && !it->isEmpty())
            canned = it->size() > 1 ? it->takeFirst() : it->first();
        return new CannedReply(request, operation, canned.statusCode, canned.body, this);
    }

private:
    struct Canned {
        int statusCode = 200;
        QByteArray body;
    };

    QHash<QString, QList<Canned>> m_responses;
    QList<RecordedRequest> m_requests;
};

} // namespace phicore::nomaiq::test
