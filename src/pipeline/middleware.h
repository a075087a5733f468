#pragma once
#include "domain/ports.h"
#include "proxy/sse_event_buffer.h"

// Hooks run around every forwarded chat request. Requests pass through the
// middlewares in registration order, responses and stream events in reverse.
// Middlewares are shared by all connections; per-request state travels in
// the ChatRequest.
class IPipelineMiddleware {
public:
    virtual ~IPipelineMiddleware() = default;
    virtual QString name() const = 0;

    virtual Result<ChatRequest> onRequest(ChatRequest request) {
        return request;
    }
    virtual Result<ProviderResponse> onResponse(ProviderResponse response,
                                                const ChatRequest& request) {
        Q_UNUSED(request);
        return response;
    }
    virtual Result<SseEvent> onEvent(SseEvent event, const ChatRequest& request) {
        Q_UNUSED(request);
        return event;
    }
};
