#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QByteArray raw;         // event block as received, without the blank line
    QString eventType;
    QByteArray data;        // data lines joined with '\n'
    bool hasData = false;

    bool isDone() const { return hasData && data == "[DONE]"; }
    bool isComment() const { return !hasData && eventType.isEmpty(); }
    QByteArray toWire() const { return raw + "\n\n"; }

    // Same event with its payload replaced; other fields are dropped.
    SseEvent withData(const QByteArray& newData) const;
};

// Splits an upstream text/event-stream body into complete events. Bytes may
// arrive in arbitrary slices; an event is only released once its blank-line
// delimiter has been seen.
class SseEventBuffer {
public:
    QList<SseEvent> append(const QByteArray& bytes);
    QList<SseEvent> flush();

    bool isEmpty() const { return m_buffer.isEmpty(); }
    int bufferedBytes() const { return m_buffer.size(); }

    static SseEvent parseBlock(const QByteArray& block);

private:
    QByteArray m_buffer;
};
