#include "stream_relay.h"
#include "adapters/executor/qt_executor.h"
#include "core/log_manager.h"

StreamRelay::StreamRelay(QNetworkReply* reply,
                         const ChatRequest& request,
                         const QList<IPipelineMiddleware*>& middlewares,
                         QObject* parent)
    : QObject(parent)
    , m_reply(reply)
    , m_request(request)
    , m_middlewares(middlewares)
{
    Q_ASSERT(m_reply);

    // Take ownership of the reply so it is cleaned up with this relay
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamRelay::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamRelay::onReplyFinished);

    // Bytes (or the whole body) may already have arrived while the executor
    // waited for the response head. Drain them once the caller is connected.
    QMetaObject::invokeMethod(this, [this]() {
        if (!m_reply || m_finished) {
            return;
        }
        if (m_reply->bytesAvailable() > 0) {
            onReadyRead();
        }
        if (m_reply && m_reply->isFinished()) {
            onReplyFinished();
        }
    }, Qt::QueuedConnection);
}

StreamRelay::~StreamRelay()
{
    if (m_reply) {
        m_reply->disconnect(this);
        if (m_reply->isRunning()) {
            m_reply->abort();
        }
    }
}

void StreamRelay::abort()
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
    }
    LOG_DEBUG(QStringLiteral("StreamRelay: aborted after %1 events").arg(m_eventCount));
}

void StreamRelay::onReadyRead()
{
    if (!m_reply || m_finished) {
        return;
    }
    relay(m_buffer.append(m_reply->readAll()));
}

void StreamRelay::onReplyFinished()
{
    if (m_finished || !m_reply) {
        return;
    }

    if (m_reply->bytesAvailable() > 0) {
        relay(m_buffer.append(m_reply->readAll()));
    }
    // Process whatever is left even if it was not blank-line terminated.
    relay(m_buffer.flush());
    if (m_finished) {
        return;
    }

    if (m_reply->error() != QNetworkReply::NoError) {
        fail(QtExecutor::mapTransportError(m_reply));
        return;
    }

    m_finished = true;
    LOG_DEBUG(QStringLiteral("StreamRelay: relayed %1 events (%2 bytes)%3")
                  .arg(m_eventCount)
                  .arg(m_relayedBytes)
                  .arg(m_sawDone ? QString() : QStringLiteral(", upstream sent no [DONE]")));
    emit finished();
}

void StreamRelay::relay(const QList<SseEvent>& events)
{
    for (const SseEvent& upstreamEvent : events) {
        if (m_finished) {
            return;
        }

        SseEvent event = upstreamEvent;
        for (auto* mw : m_middlewares) {
            auto r = mw->onEvent(std::move(event), m_request);
            if (!r) {
                fail(r.error());
                return;
            }
            event = *r;
        }

        if (event.isDone()) {
            m_sawDone = true;
        }

        const QByteArray wire = event.toWire();
        ++m_eventCount;
        m_relayedBytes += wire.size();
        emit eventReady(wire);
    }
}

void StreamRelay::fail(const DomainFailure& failure)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    LOG_ERROR(QStringLiteral("StreamRelay error [%1]: %2 %3")
                  .arg(failure.code, failure.message, failure.details));
    if (m_reply && m_reply->isRunning()) {
        m_reply->disconnect(this);
        m_reply->abort();
    }
    emit error(failure);
}
