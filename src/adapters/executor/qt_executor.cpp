#include "qt_executor.h"
#include "core/log_manager.h"
#include <QTimer>
#include <QUrl>
#include <memory>

namespace {

// Shared by the slots of one in-flight call; dropped with the last of them.
struct PendingCall {
    ConnectionPool::Lease lease;
    QList<QMetaObject::Connection> connections;
    bool done = false;
    bool headSeen = false;

    void disconnectAll() {
        for (const auto& c : std::as_const(connections))
            QObject::disconnect(c);
        connections.clear();
    }
};

// Destroying context aborts the reply without running the completion slots.
void bindToContext(QNetworkReply* reply, QObject* context,
                   const std::shared_ptr<PendingCall>& call)
{
    call->connections.append(QObject::connect(context, &QObject::destroyed, reply,
        [reply, call]() {
            if (call->done)
                return;
            call->done = true;
            call->disconnectAll();
            reply->abort();
            reply->deleteLater();
            call->lease.reset();
        }));
}

}

QtExecutor::QtExecutor(ConnectionPool& pool, const QSslConfiguration& sslConfig)
    : m_pool(pool)
    , m_sslConfig(sslConfig)
{
}

QtExecutor::~QtExecutor()
{
    // Live stream replies outlive the calls that opened them; hand their managers back.
    for (auto it = m_streamManagers.begin(); it != m_streamManagers.end(); ++it) {
        QObject::disconnect(it.value().onDestroyed);
        m_pool.release(it.value().nam);
    }
    m_streamManagers.clear();
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};
    if (req.url().scheme() == QStringLiteral("https"))
        req.setSslConfiguration(m_sslConfig);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setTransferTimeout(m_requestTimeout);
    return req;
}

QNetworkReply* QtExecutor::send(QNetworkAccessManager* nam, const ProviderRequest& request) const {
    const QNetworkRequest req = buildQtRequest(request);
    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return nam->post(req, request.body);
    if (method == "GET")
        return nam->get(req);
    return nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

// Aborting reports OperationCanceledError, which maps to a timeout.
void QtExecutor::startDeadline(QNetworkReply* reply, int timeoutMs) const {
    auto* timer = reply->findChild<QTimer*>(QStringLiteral("deadline"));
    if (!timer) {
        timer = new QTimer(reply);
        timer->setObjectName(QStringLiteral("deadline"));
        timer->setSingleShot(true);
        QObject::connect(timer, &QTimer::timeout, reply, [reply]() {
            if (reply->isRunning()) {
                LOG_WARNING(QStringLiteral("QtExecutor: %1 timed out")
                                .arg(reply->url().toString()));
                reply->abort();
            }
        });
    }
    timer->start(timeoutMs);
}

int QtExecutor::statusCodeOf(QNetworkReply* reply) {
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

QString QtExecutor::contentTypeOf(QNetworkReply* reply) {
    return reply->header(QNetworkRequest::ContentTypeHeader).toString();
}

DomainFailure QtExecutor::mapTransportError(QNetworkReply* reply) {
    if (!reply)
        return DomainFailure::internal(QStringLiteral("null reply"));

    switch (reply->error()) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        return DomainFailure::timeout(QStringLiteral("Upstream request timed out"));
    default:
        return DomainFailure::badGateway(QStringLiteral("Failed to forward request"),
                                         reply->errorString());
    }
}

void QtExecutor::execute(const ProviderRequest& request,
                         QObject* context,
                         ResponseCallback callback) {
    auto call = std::make_shared<PendingCall>();
    call->lease = m_pool.lease();
    QNetworkReply* reply = send(call->lease.get(), request);
    startDeadline(reply, m_requestTimeout);
    bindToContext(reply, context, call);

    const QString method = request.method;
    const QString url = request.url;
    call->connections.append(QObject::connect(reply, &QNetworkReply::finished, context,
        [reply, call, callback, method, url]() {
            if (call->done)
                return;
            call->done = true;
            call->disconnectAll();
            reply->deleteLater();

            // An HTTP status means the upstream answered; its error bodies are
            // relayed as they are. Only transport failures become a DomainFailure.
            const int status = statusCodeOf(reply);
            if (status <= 0) {
                LOG_ERROR(QStringLiteral("QtExecutor: %1 %2 failed: %3")
                              .arg(method, url, reply->errorString()));
                const DomainFailure failure = mapTransportError(reply);
                call->lease.reset();
                callback(std::unexpected(failure));
                return;
            }

            ProviderResponse resp;
            resp.statusCode = status;
            resp.contentType = contentTypeOf(reply);
            resp.body = reply->readAll();
            for (const auto& header : reply->rawHeaderList())
                resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
            call->lease.reset();
            callback(resp);
        }));
}

void QtExecutor::adoptStreamManager(QNetworkReply* reply, QNetworkAccessManager* nam) {
    StreamManager manager;
    manager.nam = nam;
    manager.onDestroyed = QObject::connect(reply, &QObject::destroyed, [this, reply]() {
        auto it = m_streamManagers.find(reply);
        if (it != m_streamManagers.end()) {
            m_pool.release(it.value().nam);
            m_streamManagers.erase(it);
        }
    });
    m_streamManagers.insert(reply, manager);
}

void QtExecutor::openStream(const ProviderRequest& request,
                            QObject* context,
                            StreamCallback callback) {
    auto call = std::make_shared<PendingCall>();
    call->lease = m_pool.lease();
    QNetworkReply* reply = send(call->lease.get(), request);
    // Only the response head is bounded here; the body is relayed as it arrives.
    startDeadline(reply, m_connectionTimeout);
    bindToContext(reply, context, call);

    const QString url = request.url;
    auto progress = [this, reply, call, callback, url]() {
        if (call->done)
            return;

        const int status = statusCodeOf(reply);
        if (status >= 200 && status < 300) {
            call->done = true;
            call->disconnectAll();
            if (auto* timer = reply->findChild<QTimer*>(QStringLiteral("deadline")))
                timer->stop();
            adoptStreamManager(reply, call->lease.take());

            ProviderStream stream;
            stream.statusCode = status;
            stream.contentType = contentTypeOf(reply);
            stream.reply = reply;
            callback(stream);
            return;
        }

        if (!reply->isFinished()) {
            // A refused stream still has its error body to drain.
            if (status > 0 && !call->headSeen) {
                call->headSeen = true;
                startDeadline(reply, m_requestTimeout);
            }
            return;
        }

        call->done = true;
        call->disconnectAll();
        reply->deleteLater();

        if (status <= 0) {
            const DomainFailure failure = mapTransportError(reply);
            LOG_ERROR(QStringLiteral("QtExecutor: stream %1 failed: %2")
                          .arg(url, failure.details.isEmpty() ? failure.message : failure.details));
            call->lease.reset();
            callback(std::unexpected(failure));
            return;
        }

        // Error answers are small JSON documents; they are relayed as a
        // regular response.
        ProviderStream stream;
        stream.statusCode = status;
        stream.contentType = contentTypeOf(reply);
        stream.body = reply->readAll();
        call->lease.reset();
        callback(stream);
    };

    call->connections.append(QObject::connect(reply, &QNetworkReply::metaDataChanged, context, progress));
    call->connections.append(QObject::connect(reply, &QNetworkReply::readyRead, context, progress));
    call->connections.append(QObject::connect(reply, &QNetworkReply::finished, context, progress));
}
