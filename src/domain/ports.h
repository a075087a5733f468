#pragma once
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QJsonDocument>
#include <QMap>
#include <QString>
#include <functional>

class QNetworkReply;
class QObject;

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

// A client chat-completions request after JSON decoding. The payload is kept
// as a document so that non-object bodies can be forwarded untouched.
struct ChatRequest {
    QJsonDocument payload;
    QString requestedModel;
    bool stream = false;
    QMap<QString, QString> metadata;
};

struct ProviderRequest {
    QString method = QStringLiteral("POST");
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QString contentType;
    QMap<QString, QString> headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

// Result of opening a streaming upstream call. A 2xx answer hands over the
// live reply; anything else is drained into body with reply left null.
struct ProviderStream {
    int statusCode = 0;
    QString contentType;
    QNetworkReply* reply = nullptr;
    QByteArray body;

    bool isLive() const { return reply != nullptr; }
};

using ResponseCallback = std::function<void(Result<ProviderResponse>)>;
using StreamCallback = std::function<void(Result<ProviderStream>)>;

// Upstream calls complete asynchronously. The callback runs at most once and
// only while context is alive; destroying context aborts the call.
class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual void execute(const ProviderRequest& request,
                         QObject* context,
                         ResponseCallback callback) = 0;
    virtual void openStream(const ProviderRequest& request,
                            QObject* context,
                            StreamCallback callback) = 0;
};
