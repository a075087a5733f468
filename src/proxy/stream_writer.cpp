#include "stream_writer.h"
#include "core/log_manager.h"
#include <QAbstractSocket>
#include <QList>

bool StreamWriter::isWritable(QIODevice* device)
{
    if (!device || !device->isWritable()) {
        return false;
    }
    if (auto* socket = qobject_cast<QAbstractSocket*>(device)) {
        return socket->state() == QAbstractSocket::ConnectedState;
    }
    return true;
}

bool StreamWriter::writeAll(QIODevice* device, const QByteArray& bytes)
{
    if (device->write(bytes) != bytes.size()) {
        LOG_WARNING(QStringLiteral("StreamWriter: short write: %1").arg(device->errorString()));
        return false;
    }
    if (auto* socket = qobject_cast<QAbstractSocket*>(device)) {
        socket->flush();
    }
    return true;
}

bool StreamWriter::writeStreamHeader(QIODevice* device, bool keepAlive)
{
    if (!isWritable(device)) {
        LOG_WARNING(QStringLiteral("StreamWriter: cannot write stream header, device not writable"));
        return false;
    }

    QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Access-Control-Allow-Origin: *\r\n";
    header.append(keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    header.append("Transfer-Encoding: chunked\r\n\r\n");

    return writeAll(device, header);
}

QByteArray StreamWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

QByteArray StreamWriter::toSseFrame(const QByteArray& data)
{
    const bool alreadySse =
        data.startsWith("event:") ||
        data.startsWith("data:") ||
        data.startsWith("id:") ||
        data.startsWith("retry:") ||
        data.startsWith(":");

    QByteArray frame;
    if (alreadySse) {
        frame = data;
        while (!frame.endsWith("\n\n"))
            frame.append('\n');
    } else {
        // Every line of a multi-line payload needs its own data field.
        QByteArray payload = data;
        while (payload.endsWith('\n'))
            payload.chop(1);
        const QList<QByteArray> lines = payload.split('\n');
        for (const QByteArray& line : lines) {
            frame.append("data: ");
            frame.append(line);
            frame.append('\n');
        }
        frame.append('\n');
    }
    return frame;
}

bool StreamWriter::sendEvent(QIODevice* device, const QByteArray& sseData)
{
    if (sseData.isEmpty()) {
        // A zero-length chunk would end the response early.
        return true;
    }
    if (!isWritable(device)) {
        LOG_WARNING(QStringLiteral("StreamWriter: cannot send event, device not writable"));
        return false;
    }
    return writeAll(device, wrapChunked(toSseFrame(sseData)));
}

bool StreamWriter::sendDone(QIODevice* device)
{
    return sendEvent(device, QByteArrayLiteral("data: [DONE]\n\n"));
}

bool StreamWriter::sendTerminator(QIODevice* device)
{
    if (!isWritable(device)) {
        LOG_WARNING(QStringLiteral("StreamWriter: cannot send terminator, device not writable"));
        return false;
    }

    // The zero-length chunk signals end of chunked transfer
    return writeAll(device, QByteArrayLiteral("0\r\n\r\n"));
}
