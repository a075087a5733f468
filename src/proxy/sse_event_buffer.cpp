#include "sse_event_buffer.h"

SseEvent SseEvent::withData(const QByteArray& newData) const
{
    SseEvent event;
    event.eventType = eventType;
    event.data = newData;
    event.hasData = true;

    if (!eventType.isEmpty()) {
        event.raw.append("event: ");
        event.raw.append(eventType.toUtf8());
        event.raw.append('\n');
    }
    const QList<QByteArray> lines = newData.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        if (i > 0) event.raw.append('\n');
        event.raw.append("data: ");
        event.raw.append(lines.at(i));
    }
    return event;
}

SseEvent SseEventBuffer::parseBlock(const QByteArray& block)
{
    SseEvent event;
    event.raw = block;

    QList<QByteArray> dataLines;
    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray& rawLine : lines) {
        // Strip any trailing \r left over from \r\n splitting
        QByteArray line = rawLine;
        if (line.endsWith('\r')) {
            line.chop(1);
        }

        if (line.isEmpty() || line.startsWith(':')) {
            // SSE comment (heartbeat/keepalive).
            continue;
        }

        const qsizetype colon = line.indexOf(':');
        const QByteArray field = colon < 0 ? line : line.left(colon);
        QByteArray value = colon < 0 ? QByteArray() : line.mid(colon + 1);
        if (value.startsWith(' ')) {
            value.remove(0, 1);
        }

        if (field == "event") {
            event.eventType = QString::fromUtf8(value);
        } else if (field == "data") {
            dataLines.append(value);
        }
        // id and retry are relayed verbatim through raw; unknown fields are ignored.
    }

    event.hasData = !dataLines.isEmpty();
    event.data = dataLines.join('\n');
    return event;
}

QList<SseEvent> SseEventBuffer::append(const QByteArray& bytes)
{
    m_buffer.append(bytes);

    QList<SseEvent> events;
    while (true) {
        // Check for "\r\n\r\n" first (longer delimiter) to avoid partial
        // matches, then fall back to "\n\n".
        qsizetype delimPos = -1;
        int delimLen = 0;

        const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
        const qsizetype lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0) {
            break;
        }

        QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        if (block.trimmed().isEmpty()) {
            continue;
        }
        if (block.endsWith('\r')) {
            block.chop(1);
        }
        events.append(parseBlock(block));
    }
    return events;
}

QList<SseEvent> SseEventBuffer::flush()
{
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return {};
    }

    // The upstream closed without a trailing blank line; release what is left.
    QByteArray rest = m_buffer;
    m_buffer.clear();
    while (rest.endsWith('\n') || rest.endsWith('\r'))
        rest.chop(1);
    return {parseBlock(rest)};
}
