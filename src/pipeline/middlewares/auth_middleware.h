#pragma once
#include "pipeline/middleware.h"

class AuthMiddleware : public IPipelineMiddleware {
public:
    explicit AuthMiddleware(const QString& authKey = {}) : m_authKey(authKey) {}
    QString name() const override { return "auth"; }
    Result<ChatRequest> onRequest(ChatRequest request) override;

    // True when no key is configured or the presented credential matches it.
    static bool isAuthorized(const QString& expectedKey, const QString& presented);

private:
    QString m_authKey;
};
