#include "pipeline.h"
#include "stream_relay.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/openai.h"
#include "core/log_manager.h"

Pipeline::Pipeline(OpenAIChatAdapter* inbound,
                   OpenAIOutbound* outbound,
                   IExecutor* executor,
                   QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_outbound(outbound)
    , m_executor(executor)
{
}

Pipeline::~Pipeline() = default;

void Pipeline::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

Result<ChatRequest> Pipeline::prepare(const QByteArray& requestBody,
                                      const QMap<QString, QString>& metadata) {
    auto decoded = m_inbound->decodeRequest(requestBody, metadata);
    if (!decoded) {
        LOG_ERROR(QStringLiteral("Pipeline: failed to parse request body: %1")
                      .arg(decoded.error().details));
        return std::unexpected(decoded.error());
    }

    ChatRequest req = *decoded;

    // Forward through middlewares in order
    for (auto& mw : m_middlewares) {
        auto r = mw->onRequest(std::move(req));
        if (!r) return std::unexpected(r.error());
        req = *r;
    }
    return req;
}

void Pipeline::process(const ChatRequest& request, QObject* context, ResponseCallback callback) {
    auto providerReq = m_outbound->buildRequest(request);
    if (!providerReq) {
        callback(std::unexpected(providerReq.error()));
        return;
    }

    LOG_INFO(QStringLiteral("Forwarding request to model API"));
    m_executor->execute(*providerReq, context,
        [this, request, callback](Result<ProviderResponse> resp) {
            if (!resp) {
                callback(std::unexpected(resp.error()));
                return;
            }
            callback(finishResponse(*resp, request));
        });
}

void Pipeline::processStream(const ChatRequest& request, QObject* context, OutcomeCallback callback) {
    auto providerReq = m_outbound->buildRequest(request);
    if (!providerReq) {
        callback(std::unexpected(providerReq.error()));
        return;
    }

    LOG_INFO(QStringLiteral("Forwarding streaming request to model API"));
    m_executor->openStream(*providerReq, context,
        [this, request, callback](Result<ProviderStream> stream) {
            if (!stream) {
                callback(std::unexpected(stream.error()));
                return;
            }

            if (!stream->isLive()) {
                LOG_WARNING(QStringLiteral("Pipeline: upstream refused stream with status %1")
                                .arg(stream->statusCode));
                ProviderResponse response;
                response.statusCode = stream->statusCode;
                response.contentType = stream->contentType;
                response.body = stream->body;
                auto finished = finishResponse(response, request);
                if (!finished) {
                    callback(std::unexpected(finished.error()));
                    return;
                }
                callback(StreamOutcome{*finished});
                return;
            }

            auto* relay = new StreamRelay(stream->reply, request, reversedMiddlewares(), this);
            callback(StreamOutcome{relay});
        });
}

Result<ProviderResponse> Pipeline::finishResponse(ProviderResponse response,
                                                  const ChatRequest& request) {
    if (!response.isSuccess()) {
        LOG_WARNING(QStringLiteral("Pipeline: upstream answered %1").arg(response.statusCode));
    }

    // Reverse through middlewares
    const auto reversed = reversedMiddlewares();
    for (auto* mw : reversed) {
        auto r = mw->onResponse(std::move(response), request);
        if (!r) return std::unexpected(r.error());
        response = *r;
    }
    return response;
}

QList<IPipelineMiddleware*> Pipeline::reversedMiddlewares() const {
    QList<IPipelineMiddleware*> list;
    list.reserve(static_cast<qsizetype>(m_middlewares.size()));
    for (auto it = m_middlewares.rbegin(); it != m_middlewares.rend(); ++it)
        list.append(it->get());
    return list;
}
