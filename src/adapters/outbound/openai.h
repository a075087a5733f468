#pragma once
#include "config/config_types.h"
#include "domain/ports.h"

// Builds the request sent to the configured OpenAI-compatible upstream.
class OpenAIOutbound {
public:
    explicit OpenAIOutbound(const UpstreamConfig& config);

    Result<ProviderRequest> buildRequest(const ChatRequest& request) const;

    static bool isValidHeaderValue(const QString& value);

private:
    UpstreamConfig m_config;
};
