#pragma once
#include "domain/failure.h"
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>

struct HttpRequest {
    QString method, path, query, httpVersion;
    QMap<QString, QString> headers;   // names lower-cased
    QByteArray body;

    QString header(const QString& name) const {
        return headers.value(name.toLower());
    }
    bool wantsClose() const;
};

struct HttpResponse {
    int status = 200;
    QByteArray contentType = "application/json";
    QByteArray body;
    bool keepAlive = true;
    QList<QPair<QByteArray, QByteArray>> extraHeaders;
};

// Incremental HTTP/1.1 request framing. Bytes are appended as they arrive on
// the socket; next() hands out one complete request at a time so pipelined
// requests are served in order.
class HttpRequestParser {
public:
    enum class State { NeedMoreData, Complete, Failed };

    static constexpr int kMaxHeaderBytes = 64 * 1024;

    explicit HttpRequestParser(qint64 maxBodyBytes = 2 * 1024 * 1024);

    void append(const QByteArray& data) { m_buffer.append(data); }
    State next(HttpRequest* request);

    int bufferedBytes() const { return m_buffer.size(); }
    const DomainFailure& failure() const { return m_failure; }
    void setMaxBodyBytes(qint64 bytes) { m_maxBodyBytes = bytes; }

private:
    State fail(const DomainFailure& failure);

    QByteArray m_buffer;
    qint64 m_maxBodyBytes;
    DomainFailure m_failure;
};

namespace http_message {

QByteArray statusText(int status);
QByteArray serialize(const HttpResponse& response);
HttpResponse fromFailure(const DomainFailure& failure, bool keepAlive = true);

}
