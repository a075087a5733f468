#include "proxy_server.h"
#include "stream_writer.h"
#include "core/log_manager.h"
#include "pipeline/pipeline.h"
#include "pipeline/stream_relay.h"
#include "pipeline/middlewares/auth_middleware.h"

#include <QHostInfo>
#include <variant>

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(QObject* parent)
    : QObject(parent)
{
    m_router.registerDefaults();
}

ProxyServer::~ProxyServer()
{
    stop();
}

void ProxyServer::setPipeline(Pipeline* pipeline)
{
    m_pipeline = pipeline;
}

// ========================================================================
// resolveListenAddress
// ========================================================================

bool ProxyServer::resolveListenAddress(const QString& host, QHostAddress* address)
{
    const QString h = host.trimmed();
    if (h.isEmpty() || h == QStringLiteral("*")) {
        *address = QHostAddress(QHostAddress::Any);
        return true;
    }
    if (h.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0) {
        *address = QHostAddress(QHostAddress::LocalHost);
        return true;
    }

    QHostAddress parsed;
    if (parsed.setAddress(h)) {
        *address = parsed;
        return true;
    }

    const QHostInfo info = QHostInfo::fromName(h);
    if (info.error() != QHostInfo::NoError || info.addresses().isEmpty()) {
        return false;
    }
    *address = info.addresses().first();
    return true;
}

// ========================================================================
// start / stop
// ========================================================================

bool ProxyServer::start(const ProxyConfig& config)
{
    if (m_server) {
        stop();
    }

    m_config = config;

    QHostAddress address;
    if (!resolveListenAddress(config.server.host, &address)) {
        LOG_ERROR(QStringLiteral("ProxyServer: cannot resolve listen host '%1'")
                      .arg(config.server.host));
        return false;
    }

    const quint16 port = static_cast<quint16>(config.server.port);
    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on %1:%2 - %3")
                      .arg(config.server.host)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("Server running on http://%1:%2")
                 .arg(config.server.host)
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    const QList<QTcpSocket*> sockets = m_connections.keys();
    for (QTcpSocket* socket : sockets) {
        const ConnectionState state = m_connections.value(socket);
        delete state.pending.data();
        StreamRelay* relay = state.relay;
        if (relay) {
            relay->abort();
            relay->deleteLater();
        }
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    m_connections.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: proxy server stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Socket events
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        // Bytes the client sends while a request is in flight stay in a
        // bounded socket buffer until the connection is idle again.
        socket->setReadBufferSize(HttpRequestParser::kMaxHeaderBytes);

        ConnectionState state;
        state.parser.setMaxBodyBytes(m_config.server.maxRequestBodyBytes);
        m_connections.insert(socket, state);

        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !m_connections.contains(socket)) {
        return;
    }

    processPending(socket);
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    auto it = m_connections.find(socket);
    if (it != m_connections.end()) {
        // Drop any upstream call still waiting for this client
        delete it->pending.data();
        // If the client disconnects mid-stream, stop pulling from upstream
        if (it->relay) {
            it->relay->abort();
            it->relay->deleteLater();
        }
        m_connections.erase(it);
    }
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

// ========================================================================
// processPending
// ========================================================================

void ProxyServer::processPending(QTcpSocket* socket)
{
    while (true) {
        auto it = m_connections.find(socket);
        if (it == m_connections.end()
            || socket->state() != QAbstractSocket::ConnectedState) {
            return;
        }
        // Requests queued behind a call or stream wait until it has ended.
        if (it->pending || it->relay || it->closeAfterResponse) {
            return;
        }
        it->parser.append(socket->readAll());

        HttpRequest request;
        const HttpRequestParser::State parseState = it->parser.next(&request);
        if (parseState == HttpRequestParser::State::NeedMoreData) {
            return;
        }
        if (parseState == HttpRequestParser::State::Failed) {
            const DomainFailure failure = it->parser.failure();
            LOG_WARNING(QStringLiteral("ProxyServer: rejecting malformed request: %1")
                            .arg(failure.message));
            it->closeAfterResponse = true;
            sendFailure(socket, failure);
            return;
        }

        it->closeAfterResponse = request.wantsClose();
        handleRequest(socket, request);
    }
}

void ProxyServer::resumeLater(QTcpSocket* socket)
{
    QMetaObject::invokeMethod(socket, [this, socket]() {
        processPending(socket);
    }, Qt::QueuedConnection);
}

// ========================================================================
// handleRequest
// ========================================================================

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    const RequestRouter::Match match = m_router.match(request.method, request.path);
    if (match.status == RequestRouter::MatchStatus::NotFound) {
        sendFailure(socket, DomainFailure::notFound(
            QStringLiteral("No route for %1").arg(request.path)));
        return;
    }
    if (match.status == RequestRouter::MatchStatus::MethodNotAllowed) {
        HttpResponse response = http_message::fromFailure(DomainFailure::methodNotAllowed(
            QStringLiteral("Method %1 not allowed for %2").arg(request.method, request.path)));
        response.extraHeaders.append({QByteArrayLiteral("Allow"),
                                      match.allowedMethods.join(QStringLiteral(", ")).toUtf8()});
        sendHttpResponse(socket, response);
        return;
    }

    switch (match.route.kind) {
    case RouteKind::ChatCompletions:
        handleChatCompletions(socket, request);
        break;
    case RouteKind::ListModels:
        handleModelsRequest(socket, request);
        break;
    }
}

void ProxyServer::handleChatCompletions(QTcpSocket* socket, const HttpRequest& request)
{
    if (!m_pipeline) {
        sendFailure(socket, DomainFailure::unavailable(QStringLiteral("pipeline not configured")));
        return;
    }

    auto prepared = m_pipeline->prepare(request.body, buildMetadata(socket, request));
    if (!prepared) {
        sendFailure(socket, prepared.error());
        return;
    }

    // The call object lives as long as the client; its deletion aborts the
    // upstream request.
    auto* call = new QObject(socket);
    m_connections[socket].pending = call;

    if (!prepared->stream) {
        m_pipeline->process(*prepared, call,
                            [this, socket, call](Result<ProviderResponse> result) {
            if (!completeCall(socket, call)) {
                return;
            }
            if (!result) {
                sendFailure(socket, result.error());
            } else {
                HttpResponse response;
                response.status = result->statusCode;
                response.body = result->body;
                if (!result->contentType.isEmpty())
                    response.contentType = result->contentType.toUtf8();
                sendHttpResponse(socket, response);
            }
            resumeLater(socket);
        });
        return;
    }

    m_pipeline->processStream(*prepared, call,
                              [this, socket, call](Result<StreamOutcome> outcome) {
        if (!completeCall(socket, call)) {
            if (outcome) {
                if (auto* relay = std::get_if<StreamRelay*>(&*outcome)) {
                    (*relay)->abort();
                    (*relay)->deleteLater();
                }
            }
            return;
        }
        if (!outcome) {
            sendFailure(socket, outcome.error());
            resumeLater(socket);
            return;
        }
        if (auto* buffered = std::get_if<ProviderResponse>(&*outcome)) {
            HttpResponse response;
            response.status = buffered->statusCode;
            response.body = buffered->body;
            if (!buffered->contentType.isEmpty())
                response.contentType = buffered->contentType.toUtf8();
            sendHttpResponse(socket, response);
            resumeLater(socket);
            return;
        }
        sendStreamResponse(socket, std::get<StreamRelay*>(*outcome));
    });
}

bool ProxyServer::completeCall(QTcpSocket* socket, QObject* call)
{
    call->deleteLater();
    auto it = m_connections.find(socket);
    if (it == m_connections.end() || it->pending != call) {
        return false;
    }
    it->pending = nullptr;
    return true;
}

void ProxyServer::handleModelsRequest(QTcpSocket* socket, const HttpRequest& request)
{
    QString presented = request.header(QStringLiteral("authorization"));
    if (presented.isEmpty()) {
        presented = request.header(QStringLiteral("x-api-key"));
    }
    if (!AuthMiddleware::isAuthorized(m_config.server.authKey, presented)) {
        sendFailure(socket, DomainFailure::unauthorized(
            QStringLiteral("Invalid or missing authentication key")));
        return;
    }

    HttpResponse response;
    response.body = m_chatAdapter.encodeModelList(m_config.upstream.defaultModel,
                                                  QStringLiteral("openai-api-proxy"));
    sendHttpResponse(socket, response);
}

// ========================================================================
// Responses
// ========================================================================

void ProxyServer::sendHttpResponse(QTcpSocket* socket, HttpResponse response)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    const bool close = m_connections.value(socket).closeAfterResponse;
    response.keepAlive = !close;
    socket->write(http_message::serialize(response));
    socket->flush();

    if (close) {
        socket->disconnectFromHost();
    }
}

void ProxyServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    sendHttpResponse(socket, http_message::fromFailure(failure));
}

void ProxyServer::sendStreamResponse(QTcpSocket* socket, StreamRelay* relay)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end()) {
        relay->abort();
        relay->deleteLater();
        return;
    }
    it->relay = relay;

    // Write the HTTP response header with chunked transfer encoding
    StreamWriter::writeStreamHeader(socket, !it->closeAfterResponse);

    // Forward each upstream event as one chunk
    connect(relay, &StreamRelay::eventReady,
            socket, [socket](const QByteArray& data) {
                StreamWriter::sendEvent(socket, data);
            });

    connect(relay, &StreamRelay::finished,
            socket, [this, socket, relay]() {
                StreamWriter::sendTerminator(socket);
                finishStream(socket, relay);
            });

    // On error, send the failure as a final SSE event, then terminate
    connect(relay, &StreamRelay::error,
            socket, [this, socket, relay](const DomainFailure& failure) {
                StreamWriter::sendEvent(socket, failure.toJsonBytes());
                StreamWriter::sendDone(socket);
                StreamWriter::sendTerminator(socket);
                finishStream(socket, relay);
            });
}

void ProxyServer::finishStream(QTcpSocket* socket, StreamRelay* relay)
{
    LOG_INFO(QStringLiteral("ProxyServer: stream closed after %1 events (%2 bytes)")
                 .arg(relay->eventCount())
                 .arg(relay->relayedBytes()));
    relay->deleteLater();

    auto it = m_connections.find(socket);
    if (it == m_connections.end() || it->relay != relay) {
        return;
    }
    it->relay = nullptr;

    if (it->closeAfterResponse) {
        socket->disconnectFromHost();
        return;
    }

    // Serve requests the client pipelined behind the stream.
    resumeLater(socket);
}

// ========================================================================
// buildMetadata
// ========================================================================

QMap<QString, QString> ProxyServer::buildMetadata(QTcpSocket* socket,
                                                  const HttpRequest& request) const
{
    QMap<QString, QString> meta;
    meta[QStringLiteral("peer")] = QStringLiteral("%1:%2")
                                       .arg(socket->peerAddress().toString())
                                       .arg(socket->peerPort());

    // Propagate the client's auth token so the pipeline can validate it
    QString authHeader = request.header(QStringLiteral("authorization"));
    if (authHeader.isEmpty()) {
        authHeader = request.header(QStringLiteral("x-api-key"));
    }
    meta[QStringLiteral("auth_key")] = authHeader;

    return meta;
}
