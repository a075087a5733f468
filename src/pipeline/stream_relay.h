#pragma once
#include "middleware.h"
#include "proxy/sse_event_buffer.h"
#include <QList>
#include <QNetworkReply>
#include <QObject>
#include <QPointer>

// Relays a live upstream text/event-stream reply event by event. Emits
// exactly one of finished() or error() unless abort() is called first.
class StreamRelay : public QObject {
    Q_OBJECT
public:
    StreamRelay(QNetworkReply* reply,
                const ChatRequest& request,
                const QList<IPipelineMiddleware*>& middlewares,
                QObject* parent = nullptr);
    ~StreamRelay() override;

    void abort();
    int eventCount() const { return m_eventCount; }
    qint64 relayedBytes() const { return m_relayedBytes; }

signals:
    void eventReady(const QByteArray& sseData);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onReadyRead();
    void onReplyFinished();

private:
    void relay(const QList<SseEvent>& events);
    void fail(const DomainFailure& failure);

    QPointer<QNetworkReply> m_reply;
    ChatRequest m_request;
    QList<IPipelineMiddleware*> m_middlewares;
    SseEventBuffer m_buffer;
    bool m_finished = false;
    bool m_sawDone = false;
    int m_eventCount = 0;
    qint64 m_relayedBytes = 0;
};
