#pragma once
#include <QByteArray>
#include <QIODevice>

// Writes an HTTP/1.1 chunked response carrying server-sent events.
class StreamWriter {
public:
    static bool writeStreamHeader(QIODevice* device, bool keepAlive = true);
    static bool sendEvent(QIODevice* device, const QByteArray& sseData);
    static bool sendDone(QIODevice* device);
    static bool sendTerminator(QIODevice* device);

    static QByteArray wrapChunked(const QByteArray& data);
    static QByteArray toSseFrame(const QByteArray& data);

private:
    static bool isWritable(QIODevice* device);
    static bool writeAll(QIODevice* device, const QByteArray& bytes);
};
