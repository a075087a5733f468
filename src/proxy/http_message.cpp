#include "http_message.h"
#include <QStringList>

bool HttpRequest::wantsClose() const {
    const QString connection = header(QStringLiteral("connection")).toLower();
    if (connection.contains(QStringLiteral("close")))
        return true;
    // HTTP/1.0 closes unless keep-alive was negotiated.
    return httpVersion == QStringLiteral("HTTP/1.0")
           && !connection.contains(QStringLiteral("keep-alive"));
}

HttpRequestParser::HttpRequestParser(qint64 maxBodyBytes)
    : m_maxBodyBytes(maxBodyBytes)
{
}

HttpRequestParser::State HttpRequestParser::fail(const DomainFailure& failure) {
    m_failure = failure;
    m_buffer.clear();
    return State::Failed;
}

HttpRequestParser::State HttpRequestParser::next(HttpRequest* request) {
    // Tolerate stray CRLFs between pipelined requests.
    while (m_buffer.startsWith("\r\n"))
        m_buffer.remove(0, 2);

    const qsizetype headerEnd = m_buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (m_buffer.size() > kMaxHeaderBytes) {
            return fail(DomainFailure::invalidInput(
                QStringLiteral("header_too_large"),
                QStringLiteral("Request header block exceeds %1 bytes").arg(kMaxHeaderBytes)));
        }
        return State::NeedMoreData;
    }
    if (headerEnd > kMaxHeaderBytes) {
        return fail(DomainFailure::invalidInput(
            QStringLiteral("header_too_large"),
            QStringLiteral("Request header block exceeds %1 bytes").arg(kMaxHeaderBytes)));
    }

    const QString headerBlock = QString::fromUtf8(m_buffer.left(headerEnd));
    const QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD TARGET HTTP/1.1"
    const QStringList parts = lines.first().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() != 3 || !parts[2].startsWith(QStringLiteral("HTTP/1."))) {
        return fail(DomainFailure::invalidInput(
            QStringLiteral("bad_request_line"),
            QStringLiteral("Malformed request line")));
    }

    HttpRequest req;
    req.method = parts[0].toUpper();
    req.httpVersion = parts[2];
    const QString target = parts[1];
    const qsizetype q = target.indexOf(QLatin1Char('?'));
    req.path = q < 0 ? target : target.left(q);
    req.query = q < 0 ? QString() : target.mid(q + 1);

    for (int i = 1; i < lines.size(); ++i) {
        const qsizetype colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            return fail(DomainFailure::invalidInput(
                QStringLiteral("bad_header"),
                QStringLiteral("Malformed header line")));
        }
        const QString key = lines[i].left(colon).trimmed().toLower();
        const QString value = lines[i].mid(colon + 1).trimmed();
        req.headers[key] = value;
    }

    if (req.header(QStringLiteral("transfer-encoding")).contains(QStringLiteral("chunked"),
                                                                 Qt::CaseInsensitive)) {
        return fail(DomainFailure::notSupported(
            QStringLiteral("chunked_body"),
            QStringLiteral("chunked request bodies are not supported")));
    }

    qint64 contentLength = 0;
    const QString lengthHeader = req.header(QStringLiteral("content-length"));
    if (!lengthHeader.isEmpty()) {
        bool ok = false;
        contentLength = lengthHeader.toLongLong(&ok);
        if (!ok || contentLength < 0) {
            return fail(DomainFailure::invalidInput(
                QStringLiteral("bad_content_length"),
                QStringLiteral("Invalid Content-Length header")));
        }
    }
    if (contentLength > m_maxBodyBytes) {
        return fail(DomainFailure::payloadTooLarge(
            QStringLiteral("Request body exceeds %1 bytes").arg(m_maxBodyBytes)));
    }

    const qint64 bodyStart = headerEnd + 4;
    const qint64 totalRequired = bodyStart + contentLength;
    if (m_buffer.size() < totalRequired) {
        return State::NeedMoreData;
    }

    req.body = m_buffer.mid(bodyStart, contentLength);
    m_buffer.remove(0, totalRequired);

    if (request)
        *request = req;
    return State::Complete;
}

namespace http_message {

QByteArray statusText(int status)
{
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default:  return "Unknown";
    }
}

QByteArray serialize(const HttpResponse& response)
{
    QByteArray out;
    out.append("HTTP/1.1 ");
    out.append(QByteArray::number(response.status));
    out.append(' ');
    out.append(statusText(response.status));
    out.append("\r\n");
    out.append("Content-Type: ").append(response.contentType).append("\r\n");
    out.append("Content-Length: ").append(QByteArray::number(response.body.size())).append("\r\n");
    out.append("Access-Control-Allow-Origin: *\r\n");
    for (const auto& header : response.extraHeaders)
        out.append(header.first).append(": ").append(header.second).append("\r\n");
    out.append(response.keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    out.append("\r\n");
    out.append(response.body);
    return out;
}

HttpResponse fromFailure(const DomainFailure& failure, bool keepAlive)
{
    HttpResponse response;
    response.status = failure.httpStatus();
    response.body = failure.toJsonBytes();
    response.keepAlive = keepAlive;
    return response;
}

}
