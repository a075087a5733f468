#include "openai.h"
#include "core/log_manager.h"

OpenAIOutbound::OpenAIOutbound(const UpstreamConfig& config)
    : m_config(config)
{
}

bool OpenAIOutbound::isValidHeaderValue(const QString& value)
{
    // Visible ASCII, space, tab and obs-text; no CR, LF or other controls.
    for (const QChar ch : value) {
        const ushort c = ch.unicode();
        if (c == '\t') {
            continue;
        }
        if (c < 0x20 || c == 0x7f || c > 0xff) {
            return false;
        }
    }
    return true;
}

Result<ProviderRequest> OpenAIOutbound::buildRequest(const ChatRequest& request) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = m_config.modelUrl;
    pr.stream = request.stream;

    const QString authorization = QStringLiteral("Bearer ") + m_config.modelKey;
    if (!isValidHeaderValue(authorization)) {
        LOG_ERROR(QStringLiteral("OpenAIOutbound: model_key cannot be used in an Authorization header"));
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Invalid configuration"),
            QStringLiteral("Failed to create authorization header")));
    }
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("Authorization")] = authorization;

    pr.body = request.payload.toJson(QJsonDocument::Compact);
    return pr;
}
