#include "auth_middleware.h"
#include "core/log_manager.h"

bool AuthMiddleware::isAuthorized(const QString& expectedKey, const QString& presented) {
    if (expectedKey.isEmpty()) {
        return true;
    }

    QString clientKey = presented.trimmed();

    // Strip "Bearer " prefix if present
    if (clientKey.startsWith(QStringLiteral("Bearer "), Qt::CaseInsensitive)) {
        clientKey = clientKey.mid(7).trimmed();
    }
    return clientKey == expectedKey;
}

Result<ChatRequest> AuthMiddleware::onRequest(ChatRequest request) {
    if (!isAuthorized(m_authKey, request.metadata.value(QStringLiteral("auth_key")))) {
        LOG_WARNING(QStringLiteral("AuthMiddleware: rejected request from %1")
                        .arg(request.metadata.value(QStringLiteral("peer"), QStringLiteral("unknown"))));
        return std::unexpected(DomainFailure::unauthorized(
            QStringLiteral("Invalid or missing authentication key")));
    }

    return request;
}
