#pragma once
#include "pipeline/middleware.h"

class DebugMiddleware : public IPipelineMiddleware {
public:
    explicit DebugMiddleware(bool enabled = false, int previewBytes = 512)
        : m_enabled(enabled), m_previewBytes(previewBytes) {}
    QString name() const override { return "debug"; }
    Result<ChatRequest> onRequest(ChatRequest request) override;
    Result<ProviderResponse> onResponse(ProviderResponse response,
                                        const ChatRequest& request) override;
    Result<SseEvent> onEvent(SseEvent event, const ChatRequest& request) override;

private:
    QString preview(const QByteArray& bytes) const;

    bool m_enabled;
    int m_previewBytes;
};
