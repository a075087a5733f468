#pragma once
#include "middleware.h"
#include "domain/ports.h"
#include <QList>
#include <QObject>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

class OpenAIChatAdapter;
class OpenAIOutbound;
class StreamRelay;

// A streaming call either yields a live relay, or (when the upstream refused
// it) a buffered response to send back as is.
using StreamOutcome = std::variant<ProviderResponse, StreamRelay*>;
using OutcomeCallback = std::function<void(Result<StreamOutcome>)>;

class Pipeline : public QObject {
    Q_OBJECT
public:
    Pipeline(OpenAIChatAdapter* inbound,
             OpenAIOutbound* outbound,
             IExecutor* executor,
             QObject* parent = nullptr);
    ~Pipeline() override;

    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);
    int middlewareCount() const { return static_cast<int>(m_middlewares.size()); }

    // Decodes the client body and runs the request middlewares.
    Result<ChatRequest> prepare(const QByteArray& requestBody,
                                const QMap<QString, QString>& metadata);

    // Both complete through callback, bound to context like IExecutor calls.
    void process(const ChatRequest& request, QObject* context, ResponseCallback callback);
    void processStream(const ChatRequest& request, QObject* context, OutcomeCallback callback);

private:
    Result<ProviderResponse> finishResponse(ProviderResponse response,
                                            const ChatRequest& request);
    QList<IPipelineMiddleware*> reversedMiddlewares() const;

    OpenAIChatAdapter* m_inbound;
    OpenAIOutbound* m_outbound;
    IExecutor* m_executor;
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;
};
