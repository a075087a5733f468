#pragma once
#include <QString>
#include <QtGlobal>

struct UpstreamConfig {
    QString modelUrl;       // full chat-completions endpoint
    QString modelKey;
    QString defaultModel;
};

struct ServerConfig {
    QString host = QStringLiteral("127.0.0.1");
    int port = 3000;
    QString authKey;        // empty = no client authentication
    qint64 maxRequestBodyBytes = 2 * 1024 * 1024;
};

struct RuntimeOptions {
    bool debugMode = false;
    bool restoreClientModel = false;
    bool disableSslStrict = false;
    bool enableConnectionPool = true;
    int connectionPoolSize = 10;
    int requestTimeout = 120000;
    int connectionTimeout = 30000;
};

struct LoggingConfig {
    QString level = QStringLiteral("info");
    QString dir;
};

struct ProxyConfig {
    UpstreamConfig upstream;
    ServerConfig server;
    RuntimeOptions runtime;
    LoggingConfig logging;

    QString listenAddress() const {
        return QStringLiteral("%1:%2").arg(server.host).arg(server.port);
    }
};
