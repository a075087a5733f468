#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSslConfiguration>

#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/openai.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/pipeline.h"
#include "pipeline/middlewares/auth_middleware.h"
#include "pipeline/middlewares/model_override_middleware.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "proxy/connection_pool.h"
#include "proxy/proxy_server.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "version.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral(PROXY_APP_NAME));
    app.setApplicationVersion(QStringLiteral(PROXY_VERSION));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("OpenAI-compatible chat completions proxy"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        QStringLiteral("config-dir"),
        QStringLiteral("Directory containing default.json and local.json."),
        QStringLiteral("dir"),
        QStringLiteral("config"));
    QCommandLineOption logLevelOption(
        QStringLiteral("log-level"),
        QStringLiteral("Minimum log level: debug, info, warn or error."),
        QStringLiteral("level"));
    parser.addOption(configDirOption);
    parser.addOption(logLevelOption);
    parser.process(app);

    LogManager& logger = LogManager::instance();

    LogManager::Level cliLevel = LogManager::Info;
    const bool hasCliLevel = parser.isSet(logLevelOption);
    if (hasCliLevel && !LogManager::parseLevel(parser.value(logLevelOption), &cliLevel)) {
        LOG_ERROR(QStringLiteral("Unknown log level '%1'").arg(parser.value(logLevelOption)));
        return 1;
    }
    if (hasCliLevel)
        logger.setMinimumLevel(cliLevel);

    // --- 2. Config ---
    ConfigStore configStore;
    if (!configStore.load(parser.value(configDirOption))) {
        LOG_ERROR(QStringLiteral("Failed to load configuration: %1")
                      .arg(configStore.errorString()));
        return 1;
    }
    const ProxyConfig config = configStore.proxyConfig();

    // --- 3. Log ---
    LogManager::Level level = LogManager::Info;
    if (hasCliLevel) {
        level = cliLevel;
    } else if (!LogManager::parseLevel(config.logging.level, &level)) {
        LOG_WARNING(QStringLiteral("Unknown logging.level '%1', using info")
                        .arg(config.logging.level));
        level = LogManager::Info;
    }
    if (!logger.initialize(config.logging.dir, level)) {
        LOG_WARNING(QStringLiteral("Could not open log directory '%1', logging to stderr only")
                        .arg(config.logging.dir));
    }

    LOG_INFO(QStringLiteral("%1 v%2 starting").arg(app.applicationName(), app.applicationVersion()));
    LOG_INFO(QStringLiteral("Configuration loaded successfully"));
    LOG_DEBUG(QStringLiteral("Config files: %1").arg(configStore.loadedFiles().join(QStringLiteral(", "))));

    // --- 4. Connection pool + Executor ---
    ConnectionPool connPool(config.runtime.connectionPoolSize);
    connPool.setEnabled(config.runtime.enableConnectionPool);

    QSslConfiguration sslConfig = QSslConfiguration::defaultConfiguration();
    sslConfig.setPeerVerifyMode(config.runtime.disableSslStrict
                                    ? QSslSocket::VerifyNone
                                    : QSslSocket::AutoVerifyPeer);
    if (config.runtime.disableSslStrict)
        LOG_WARNING(QStringLiteral("TLS certificate verification is disabled"));

    QtExecutor executor(connPool, sslConfig);
    executor.setRequestTimeout(config.runtime.requestTimeout);
    executor.setConnectionTimeout(config.runtime.connectionTimeout);

    // --- 5. Adapters ---
    OpenAIChatAdapter inbound;
    OpenAIOutbound outbound(config.upstream);

    // --- 6. Pipeline ---
    Pipeline pipeline(&inbound, &outbound, &executor, &app);

    pipeline.addMiddleware(std::make_unique<AuthMiddleware>(
        config.server.authKey));

    pipeline.addMiddleware(std::make_unique<ModelOverrideMiddleware>(
        config.upstream.defaultModel,
        config.runtime.restoreClientModel));

    pipeline.addMiddleware(std::make_unique<DebugMiddleware>(
        config.runtime.debugMode));

    // --- 7. Proxy server ---
    ProxyServer server;
    server.setPipeline(&pipeline);
    if (!server.start(config)) {
        LOG_ERROR(QStringLiteral("Failed to start server on %1").arg(config.listenAddress()));
        return 1;
    }

    return app.exec();
}
