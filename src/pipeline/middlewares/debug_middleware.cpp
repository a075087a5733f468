#include "debug_middleware.h"
#include "core/log_manager.h"

QString DebugMiddleware::preview(const QByteArray& bytes) const {
    if (bytes.size() <= m_previewBytes)
        return QString::fromUtf8(bytes);
    return QString::fromUtf8(bytes.left(m_previewBytes)) + QStringLiteral("...");
}

Result<ChatRequest> DebugMiddleware::onRequest(ChatRequest request) {
    if (m_enabled) {
        LOG_INFO(QStringLiteral("[Debug] Request: model=%1, stream=%2, body=%3")
            .arg(request.requestedModel)
            .arg(request.stream)
            .arg(preview(request.payload.toJson(QJsonDocument::Compact))));
    }
    return request;
}

Result<ProviderResponse> DebugMiddleware::onResponse(ProviderResponse response,
                                                     const ChatRequest& request) {
    Q_UNUSED(request);
    if (m_enabled) {
        LOG_INFO(QStringLiteral("[Debug] Response: status=%1, bytes=%2, body=%3")
            .arg(response.statusCode)
            .arg(response.body.size())
            .arg(preview(response.body)));
    }
    return response;
}

Result<SseEvent> DebugMiddleware::onEvent(SseEvent event, const ChatRequest& request) {
    Q_UNUSED(request);
    if (m_enabled) {
        LOG_INFO(QStringLiteral("[Debug] Event: type=%1, done=%2, data=%3")
            .arg(event.eventType.isEmpty() ? QStringLiteral("message") : event.eventType)
            .arg(event.isDone())
            .arg(preview(event.data)));
    }
    return event;
}
