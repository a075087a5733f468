#pragma once
#include "domain/ports.h"
#include <QByteArray>
#include <QMap>
#include <QString>

// Client-facing side of the OpenAI chat-completions protocol.
class OpenAIChatAdapter {
public:
    Result<ChatRequest> decodeRequest(const QByteArray& body,
                                      const QMap<QString, QString>& metadata) const;

    QByteArray encodeModelList(const QString& modelId, const QString& ownedBy) const;
};
