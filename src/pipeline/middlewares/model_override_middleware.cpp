#include "model_override_middleware.h"
#include "core/log_manager.h"
#include <QJsonDocument>

Result<ChatRequest> ModelOverrideMiddleware::onRequest(ChatRequest request) {
    if (m_defaultModel.isEmpty() || !request.payload.isObject()) {
        return request;
    }

    QJsonObject obj = request.payload.object();
    request.metadata[QStringLiteral("original_model")] = request.requestedModel;
    obj[QStringLiteral("model")] = m_defaultModel;
    request.payload.setObject(obj);

    if (request.requestedModel != m_defaultModel) {
        LOG_DEBUG(QStringLiteral("ModelOverrideMiddleware: model '%1' -> '%2'")
                      .arg(request.requestedModel, m_defaultModel));
    }
    return request;
}

bool ModelOverrideMiddleware::rewriteModel(QByteArray* json, const QString& model) const {
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(*json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }
    QJsonObject obj = doc.object();
    if (!obj.contains(QStringLiteral("model"))) {
        return false;
    }
    obj[QStringLiteral("model")] = model;
    *json = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    return true;
}

Result<ProviderResponse> ModelOverrideMiddleware::onResponse(ProviderResponse response,
                                                             const ChatRequest& request) {
    if (!m_restoreClientModel || request.requestedModel.isEmpty() || !response.isSuccess()) {
        return response;
    }
    rewriteModel(&response.body, request.requestedModel);
    return response;
}

Result<SseEvent> ModelOverrideMiddleware::onEvent(SseEvent event, const ChatRequest& request) {
    if (!m_restoreClientModel || request.requestedModel.isEmpty()
        || !event.hasData || event.isDone()) {
        return event;
    }
    QByteArray data = event.data;
    if (rewriteModel(&data, request.requestedModel)) {
        return event.withData(data);
    }
    return event;
}
