#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <optional>
#include "pipeline/pipeline.h"
#include "pipeline/middleware.h"
#include "pipeline/middlewares/auth_middleware.h"
#include "pipeline/middlewares/model_override_middleware.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/openai.h"

// Records the last upstream request and answers with a canned response.
// With deferred set, the answer waits until complete() is called.
class MockExecutor : public IExecutor {
public:
    void execute(const ProviderRequest& request, QObject* context,
                 ResponseCallback callback) override {
        Q_UNUSED(context);
        lastRequest = request;
        ++calls;
        auto answer = [this, callback]() {
            if (failure)
                callback(std::unexpected(*failure));
            else
                callback(response);
        };
        if (deferred)
            m_pending = answer;
        else
            answer();
    }

    void openStream(const ProviderRequest& request, QObject* context,
                    StreamCallback callback) override {
        Q_UNUSED(context);
        lastRequest = request;
        ++calls;
        if (failure) {
            callback(std::unexpected(*failure));
            return;
        }
        ProviderStream stream;
        stream.statusCode = response.statusCode;
        stream.contentType = response.contentType;
        stream.body = response.body;
        callback(stream);
    }

    void complete() {
        if (m_pending) {
            auto answer = std::move(m_pending);
            m_pending = nullptr;
            answer();
        }
    }

    ProviderRequest lastRequest;
    ProviderResponse response;
    std::optional<DomainFailure> failure;
    bool deferred = false;
    int calls = 0;

private:
    std::function<void()> m_pending;
};

namespace {

UpstreamConfig upstreamConfig(const QString& key = QStringLiteral("sk-upstream"))
{
    UpstreamConfig config;
    config.modelUrl = QStringLiteral("https://upstream.example/v1/chat/completions");
    config.modelKey = key;
    config.defaultModel = QStringLiteral("upstream-model");
    return config;
}

QMap<QString, QString> metadataWithKey(const QString& authHeader)
{
    QMap<QString, QString> meta;
    meta[QStringLiteral("auth_key")] = authHeader;
    meta[QStringLiteral("peer")] = QStringLiteral("127.0.0.1:5555");
    return meta;
}

QJsonObject parseObject(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).object();
}

Result<ProviderResponse> runProcess(Pipeline& pipeline, const ChatRequest& request)
{
    QObject context;
    std::optional<Result<ProviderResponse>> out;
    pipeline.process(request, &context, [&out](Result<ProviderResponse> result) {
        out = std::move(result);
    });
    if (!out)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no result delivered")));
    return *out;
}

Result<StreamOutcome> runProcessStream(Pipeline& pipeline, const ChatRequest& request)
{
    QObject context;
    std::optional<Result<StreamOutcome>> out;
    pipeline.processStream(request, &context, [&out](Result<StreamOutcome> result) {
        out = std::move(result);
    });
    if (!out)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no result delivered")));
    return *out;
}

}

class TestPipeline : public QObject {
    Q_OBJECT

private slots:
    void testAuthMiddlewarePass() {
        AuthMiddleware mw(QStringLiteral("test-key"));

        ChatRequest req;
        req.metadata[QStringLiteral("auth_key")] = QStringLiteral("Bearer test-key");
        auto result = mw.onRequest(std::move(req));
        QVERIFY(result.has_value());
    }

    void testAuthMiddlewareFail() {
        AuthMiddleware mw(QStringLiteral("test-key"));

        ChatRequest req;
        req.metadata[QStringLiteral("auth_key")] = QStringLiteral("Bearer wrong-key");
        auto result = mw.onRequest(std::move(req));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Unauthorized);
        QCOMPARE(result.error().httpStatus(), 401);
    }

    void testAuthMiddlewareDisabled() {
        QVERIFY(AuthMiddleware::isAuthorized(QString(), QString()));
        QVERIFY(AuthMiddleware::isAuthorized(QStringLiteral("k"), QStringLiteral("k")));
        QVERIFY(AuthMiddleware::isAuthorized(QStringLiteral("k"), QStringLiteral("bearer k")));
        QVERIFY(!AuthMiddleware::isAuthorized(QStringLiteral("k"), QString()));
    }

    void testModelOverride() {
        ModelOverrideMiddleware mw(QStringLiteral("upstream-model"));

        ChatRequest req;
        QJsonObject body;
        body[QStringLiteral("model")] = QStringLiteral("gpt-4");
        req.payload = QJsonDocument(body);
        req.requestedModel = QStringLiteral("gpt-4");

        auto result = mw.onRequest(std::move(req));
        QVERIFY(result.has_value());
        QCOMPARE(result->payload.object()[QStringLiteral("model")].toString(),
                 QStringLiteral("upstream-model"));
        QCOMPARE(result->metadata.value(QStringLiteral("original_model")), QStringLiteral("gpt-4"));
    }

    void testModelOverrideRestoresResponseModel() {
        ModelOverrideMiddleware mw(QStringLiteral("upstream-model"), true);

        ChatRequest req;
        req.requestedModel = QStringLiteral("gpt-4");

        ProviderResponse resp;
        resp.statusCode = 200;
        resp.body = "{\"id\":\"x\",\"model\":\"upstream-model\"}";
        auto result = mw.onResponse(resp, req);
        QVERIFY(result.has_value());
        QCOMPARE(parseObject(result->body)[QStringLiteral("model")].toString(),
                 QStringLiteral("gpt-4"));

        SseEvent event = SseEventBuffer::parseBlock("data: {\"model\":\"upstream-model\"}");
        auto rewritten = mw.onEvent(event, req);
        QVERIFY(rewritten.has_value());
        QCOMPARE(parseObject(rewritten->data)[QStringLiteral("model")].toString(),
                 QStringLiteral("gpt-4"));

        SseEvent done = SseEventBuffer::parseBlock("data: [DONE]");
        QCOMPARE(mw.onEvent(done, req)->raw, QByteArray("data: [DONE]"));
    }

    void testForwardsWithConfiguredModelAndKey() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.response.statusCode = 200;
        executor.response.contentType = QStringLiteral("application/json");
        executor.response.body = "{\"model\":\"upstream-model\",\"choices\":[]}";

        Pipeline pipeline(&inbound, &outbound, &executor);
        pipeline.addMiddleware(std::make_unique<AuthMiddleware>());
        pipeline.addMiddleware(std::make_unique<ModelOverrideMiddleware>(
            QStringLiteral("upstream-model")));
        pipeline.addMiddleware(std::make_unique<DebugMiddleware>(true));
        QCOMPARE(pipeline.middlewareCount(), 3);

        auto prepared = pipeline.prepare(
            "{\"model\":\"gpt-4\",\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}]}",
            metadataWithKey(QString()));
        QVERIFY(prepared.has_value());
        QVERIFY(!prepared->stream);

        auto result = runProcess(pipeline, *prepared);
        QVERIFY(result.has_value());
        QCOMPARE(result->statusCode, 200);
        QCOMPARE(result->body, executor.response.body);

        QCOMPARE(executor.lastRequest.method, QStringLiteral("POST"));
        QCOMPARE(executor.lastRequest.url,
                 QStringLiteral("https://upstream.example/v1/chat/completions"));
        QCOMPARE(executor.lastRequest.headers.value(QStringLiteral("Authorization")),
                 QStringLiteral("Bearer sk-upstream"));
        QCOMPARE(executor.lastRequest.headers.value(QStringLiteral("Content-Type")),
                 QStringLiteral("application/json"));

        const QJsonObject sent = parseObject(executor.lastRequest.body);
        QCOMPARE(sent[QStringLiteral("model")].toString(), QStringLiteral("upstream-model"));
        QCOMPARE(sent[QStringLiteral("messages")].toArray().size(), 1);
    }

    void testInvalidJsonIsRejected() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        Pipeline pipeline(&inbound, &outbound, &executor);

        auto prepared = pipeline.prepare("{not json", {});
        QVERIFY(!prepared.has_value());
        QCOMPARE(prepared.error().httpStatus(), 400);
        QCOMPARE(prepared.error().message, QStringLiteral("Invalid request body"));
        QCOMPARE(prepared.error().details, QStringLiteral("Could not parse request body as JSON"));
        QCOMPARE(executor.calls, 0);
    }

    void testUnauthorizedNeverReachesUpstream() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        Pipeline pipeline(&inbound, &outbound, &executor);
        pipeline.addMiddleware(std::make_unique<AuthMiddleware>(QStringLiteral("client-key")));

        auto prepared = pipeline.prepare("{\"model\":\"x\"}",
                                         metadataWithKey(QStringLiteral("Bearer nope")));
        QVERIFY(!prepared.has_value());
        QCOMPARE(prepared.error().httpStatus(), 401);
        QCOMPARE(executor.calls, 0);
    }

    void testNonObjectPayloadForwardedUnchanged() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.response.statusCode = 400;
        executor.response.body = "{\"error\":\"bad\"}";
        Pipeline pipeline(&inbound, &outbound, &executor);
        pipeline.addMiddleware(std::make_unique<ModelOverrideMiddleware>(
            QStringLiteral("upstream-model")));

        auto prepared = pipeline.prepare("[1,2,3]", {});
        QVERIFY(prepared.has_value());
        QVERIFY(!prepared->stream);

        auto result = runProcess(pipeline, *prepared);
        QVERIFY(result.has_value());
        QCOMPARE(executor.lastRequest.body, QByteArray("[1,2,3]"));
        // Upstream errors are relayed, not mapped
        QCOMPARE(result->statusCode, 400);
        QCOMPARE(result->body, QByteArray("{\"error\":\"bad\"}"));
    }

    void testInvalidKeyIsConfigurationError() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig(QStringLiteral("bad\nkey")));
        MockExecutor executor;
        Pipeline pipeline(&inbound, &outbound, &executor);

        auto prepared = pipeline.prepare("{\"model\":\"x\"}", {});
        QVERIFY(prepared.has_value());
        auto result = runProcess(pipeline, *prepared);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 500);
        QCOMPARE(result.error().message, QStringLiteral("Invalid configuration"));
        QCOMPARE(result.error().details, QStringLiteral("Failed to create authorization header"));
        QCOMPARE(executor.calls, 0);
    }

    void testTransportFailurePropagates() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.failure = DomainFailure::badGateway(QStringLiteral("Failed to forward request"),
                                                     QStringLiteral("Connection refused"));
        Pipeline pipeline(&inbound, &outbound, &executor);

        auto prepared = pipeline.prepare("{\"model\":\"x\"}", {});
        QVERIFY(prepared.has_value());
        auto result = runProcess(pipeline, *prepared);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 502);
        QCOMPARE(result.error().message, QStringLiteral("Failed to forward request"));
    }

    void testRefusedStreamIsBuffered() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.response.statusCode = 429;
        executor.response.contentType = QStringLiteral("application/json");
        executor.response.body = "{\"error\":{\"message\":\"slow down\"}}";
        Pipeline pipeline(&inbound, &outbound, &executor);

        auto prepared = pipeline.prepare("{\"model\":\"x\",\"stream\":true}", {});
        QVERIFY(prepared.has_value());
        QVERIFY(prepared->stream);

        auto outcome = runProcessStream(pipeline, *prepared);
        QVERIFY(outcome.has_value());
        QVERIFY(executor.lastRequest.stream);
        auto* buffered = std::get_if<ProviderResponse>(&*outcome);
        QVERIFY(buffered != nullptr);
        QCOMPARE(buffered->statusCode, 429);
        QCOMPARE(buffered->body, executor.response.body);
    }

    void testResponseArrivesWhenExecutorCompletes() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.deferred = true;
        executor.response.statusCode = 200;
        executor.response.body = "{\"model\":\"upstream-model\"}";
        Pipeline pipeline(&inbound, &outbound, &executor);
        pipeline.addMiddleware(std::make_unique<ModelOverrideMiddleware>(
            QStringLiteral("upstream-model"), true));

        auto prepared = pipeline.prepare("{\"model\":\"client-model\"}", {});
        QVERIFY(prepared.has_value());

        QObject context;
        std::optional<Result<ProviderResponse>> out;
        pipeline.process(*prepared, &context, [&out](Result<ProviderResponse> result) {
            out = std::move(result);
        });
        QCOMPARE(executor.calls, 1);
        QVERIFY(!out.has_value());

        executor.complete();
        QVERIFY(out.has_value());
        QVERIFY(out->has_value());
        QCOMPARE(parseObject((*out)->body)[QStringLiteral("model")].toString(),
                 QStringLiteral("client-model"));
    }

    void testRestoreClientModelOnResponse() {
        OpenAIChatAdapter inbound;
        OpenAIOutbound outbound(upstreamConfig());
        MockExecutor executor;
        executor.response.statusCode = 200;
        executor.response.body = "{\"model\":\"upstream-model\"}";
        Pipeline pipeline(&inbound, &outbound, &executor);
        pipeline.addMiddleware(std::make_unique<ModelOverrideMiddleware>(
            QStringLiteral("upstream-model"), true));

        auto prepared = pipeline.prepare("{\"model\":\"client-model\"}", {});
        QVERIFY(prepared.has_value());
        auto result = runProcess(pipeline, *prepared);
        QVERIFY(result.has_value());
        QCOMPARE(parseObject(result->body)[QStringLiteral("model")].toString(),
                 QStringLiteral("client-model"));
    }

    void testModelListEncoding() {
        OpenAIChatAdapter inbound;
        const QJsonObject list = parseObject(
            inbound.encodeModelList(QStringLiteral("upstream-model"), QStringLiteral("owner")));
        QCOMPARE(list[QStringLiteral("object")].toString(), QStringLiteral("list"));
        const QJsonObject first = list[QStringLiteral("data")].toArray().first().toObject();
        QCOMPARE(first[QStringLiteral("id")].toString(), QStringLiteral("upstream-model"));
        QCOMPARE(first[QStringLiteral("object")].toString(), QStringLiteral("model"));
        QCOMPARE(first[QStringLiteral("owned_by")].toString(), QStringLiteral("owner"));
    }
};

QTEST_MAIN(TestPipeline)
#include "tst_pipeline.moc"
