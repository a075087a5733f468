#pragma once
#include "http_message.h"
#include "request_router.h"
#include "adapters/inbound/openai_chat.h"
#include "config/config_types.h"
#include <QHostAddress>
#include <QMap>
#include <QObject>
#include <QPointer>
#include <QTcpServer>
#include <QTcpSocket>

class Pipeline;
class StreamRelay;

class ProxyServer : public QObject {
    Q_OBJECT
public:
    explicit ProxyServer(QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start(const ProxyConfig& config);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    void setPipeline(Pipeline* pipeline);

    static bool resolveListenAddress(const QString& host, QHostAddress* address);

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct ConnectionState {
        HttpRequestParser parser;
        StreamRelay* relay = nullptr;
        bool closeAfterResponse = false;
        // Context of the upstream call in flight; deleting it aborts the call.
        QPointer<QObject> pending;
    };

    void processPending(QTcpSocket* socket);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleChatCompletions(QTcpSocket* socket, const HttpRequest& request);
    void handleModelsRequest(QTcpSocket* socket, const HttpRequest& request);
    bool completeCall(QTcpSocket* socket, QObject* call);
    void resumeLater(QTcpSocket* socket);
    void sendHttpResponse(QTcpSocket* socket, HttpResponse response);
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure);
    void sendStreamResponse(QTcpSocket* socket, StreamRelay* relay);
    void finishStream(QTcpSocket* socket, StreamRelay* relay);
    QMap<QString, QString> buildMetadata(QTcpSocket* socket,
                                         const HttpRequest& request) const;

    QTcpServer* m_server = nullptr;
    RequestRouter m_router;
    OpenAIChatAdapter m_chatAdapter;
    Pipeline* m_pipeline = nullptr;
    ProxyConfig m_config;
    QMap<QTcpSocket*, ConnectionState> m_connections;
};
