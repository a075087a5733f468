#pragma once
#include "pipeline/middleware.h"
#include <QJsonObject>

// Forces every forwarded request onto the configured upstream model. With
// restoreClientModel the upstream's "model" field is rewritten back to what
// the client asked for.
class ModelOverrideMiddleware : public IPipelineMiddleware {
public:
    explicit ModelOverrideMiddleware(const QString& defaultModel,
                                     bool restoreClientModel = false)
        : m_defaultModel(defaultModel), m_restoreClientModel(restoreClientModel) {}
    QString name() const override { return "model_override"; }
    Result<ChatRequest> onRequest(ChatRequest request) override;
    Result<ProviderResponse> onResponse(ProviderResponse response,
                                        const ChatRequest& request) override;
    Result<SseEvent> onEvent(SseEvent event, const ChatRequest& request) override;

private:
    bool rewriteModel(QByteArray* json, const QString& model) const;

    QString m_defaultModel;
    bool m_restoreClientModel;
};
