#include "adapters/inbound/openai_chat.h"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>

Result<ChatRequest> OpenAIChatAdapter::decodeRequest(const QByteArray& body,
                                                     const QMap<QString, QString>& metadata) const
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || doc.isNull()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_request_body"),
            QStringLiteral("Invalid request body"),
            QStringLiteral("Could not parse request body as JSON")));
    }

    ChatRequest req;
    req.payload = doc;
    req.metadata = metadata;

    if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        req.requestedModel = obj.value(QStringLiteral("model")).toString();
        req.stream = obj.value(QStringLiteral("stream")).toBool(false);
    }

    return req;
}

QByteArray OpenAIChatAdapter::encodeModelList(const QString& modelId, const QString& ownedBy) const
{
    QJsonObject model;
    model[QStringLiteral("id")] = modelId;
    model[QStringLiteral("object")] = QStringLiteral("model");
    model[QStringLiteral("created")] = QDateTime::currentSecsSinceEpoch();
    model[QStringLiteral("owned_by")] = ownedBy;

    QJsonArray data;
    data.append(model);

    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    root[QStringLiteral("data")] = data;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}
