#include "config_store.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QUrl>
#include <limits>

namespace {

const char* const kRequiredKeys[][2] = {
    {"model_url", "modelUrl"},
    {"model_key", "modelKey"},
    {"default_model", "defaultModel"},
    {"port", "port"},
    {"host", "host"},
};

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = {})
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isUndefined() || value.isNull())
        return fallback;
    if (value.isDouble())
        return QString::number(value.toDouble());
    return value.toString(fallback);
}

// Numbers may be written as JSON numbers or numeric strings.
bool jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                   int fallback, int* out)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isUndefined() || value.isNull()) {
        *out = fallback;
        return true;
    }
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()
            || d != static_cast<double>(static_cast<int>(d)))
            return false;
        *out = static_cast<int>(d);
        return true;
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (!ok)
            return false;
        *out = parsed;
        return true;
    }
    return false;
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isString()) {
        const QString s = value.toString().trimmed().toLower();
        return s == "true" || s == "1" || s == "yes" || s == "on";
    }
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

}

bool ConfigStore::readJsonFile(const QString& path, QJsonObject* out) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot open config file %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_error = QStringLiteral("config file %1 is not valid JSON at offset %2: %3")
                      .arg(path)
                      .arg(parseError.offset)
                      .arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_error = QStringLiteral("config file %1 must contain a JSON object").arg(path);
        return false;
    }

    *out = doc.object();
    m_loadedFiles.append(path);
    return true;
}

bool ConfigStore::load(const QString& configDir) {
    m_error.clear();
    m_loadedFiles.clear();

    const QDir dir(configDir.isEmpty() ? QStringLiteral("config") : configDir);
    const QString defaultPath = dir.filePath(QStringLiteral("default.json"));
    const QString localPath = dir.filePath(QStringLiteral("local.json"));

    QJsonObject root;
    if (!readJsonFile(defaultPath, &root))
        return false;

    if (QFileInfo::exists(localPath)) {
        QJsonObject local;
        if (!readJsonFile(localPath, &local))
            return false;
        root = mergeObjects(root, local);
    }

    return loadFromJson(root);
}

bool ConfigStore::loadFromJson(const QJsonObject& root) {
    m_error.clear();

    for (const auto& key : kRequiredKeys) {
        if (!root.contains(QString::fromUtf8(key[0])) && !root.contains(QString::fromUtf8(key[1]))) {
            m_error = QStringLiteral("missing required config key: %1").arg(QString::fromUtf8(key[0]));
            return false;
        }
    }

    ProxyConfig config;

    // upstream
    config.upstream.modelUrl = jsonStringEither(root, "model_url", "modelUrl").trimmed();
    config.upstream.modelKey = decodeApiKey(jsonStringEither(root, "model_key", "modelKey"));
    config.upstream.defaultModel = jsonStringEither(root, "default_model", "defaultModel").trimmed();

    // server
    config.server.host = jsonStringEither(root, "host", "host").trimmed();
    if (!jsonIntEither(root, "port", "port", config.server.port, &config.server.port)) {
        m_error = QStringLiteral("config key port must be an integer");
        return false;
    }
    config.server.authKey = jsonStringEither(root, "auth_key", "authKey");
    const QJsonValue maxBody = jsonValueEither(root, "max_request_body_bytes", "maxRequestBodyBytes");
    if (!maxBody.isUndefined()) {
        if (!maxBody.isDouble() || maxBody.toDouble() < 1) {
            m_error = QStringLiteral("config key max_request_body_bytes must be a positive number");
            return false;
        }
        config.server.maxRequestBodyBytes = static_cast<qint64>(maxBody.toDouble());
    }

    // runtime
    const QJsonObject rt = root.value("runtime").toObject();
    config.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", false);
    config.runtime.restoreClientModel = jsonBoolEither(rt, "restore_client_model", "restoreClientModel", false);
    config.runtime.disableSslStrict = jsonBoolEither(rt, "disable_ssl_strict", "disableSslStrict", false);
    config.runtime.enableConnectionPool = jsonBoolEither(rt, "enable_connection_pool", "enableConnectionPool", true);
    int value = 0;
    if (!jsonIntEither(rt, "connection_pool_size", "connectionPoolSize", 10, &value)) {
        m_error = QStringLiteral("config key runtime.connection_pool_size must be an integer");
        return false;
    }
    config.runtime.connectionPoolSize = clampInt(value, 1, 200);
    if (!jsonIntEither(rt, "request_timeout", "requestTimeout", 120000, &value)) {
        m_error = QStringLiteral("config key runtime.request_timeout must be an integer");
        return false;
    }
    config.runtime.requestTimeout = clampInt(value, 1000, 600000);
    if (!jsonIntEither(rt, "connection_timeout", "connectionTimeout", 30000, &value)) {
        m_error = QStringLiteral("config key runtime.connection_timeout must be an integer");
        return false;
    }
    config.runtime.connectionTimeout = clampInt(value, 500, 300000);

    // logging
    const QJsonObject lg = root.value("logging").toObject();
    config.logging.level = jsonStringEither(lg, "level", "level", config.logging.level);
    config.logging.dir = jsonStringEither(lg, "dir", "dir");

    if (!validate(config))
        return false;

    m_config = config;
    return true;
}

bool ConfigStore::validate(const ProxyConfig& config) {
    const QUrl url(config.upstream.modelUrl, QUrl::StrictMode);
    const QString scheme = url.scheme().toLower();
    if (!url.isValid() || url.host().isEmpty()
        || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
        m_error = QStringLiteral("model_url must be an absolute http(s) URL: %1")
                      .arg(config.upstream.modelUrl);
        return false;
    }

    if (config.upstream.defaultModel.isEmpty()) {
        m_error = QStringLiteral("default_model must not be empty");
        return false;
    }

    if (config.upstream.modelKey.isEmpty()) {
        LOG_WARNING(QStringLiteral("ConfigStore: model_key is empty, upstream requests "
                                   "will carry an empty bearer token"));
    }

    if (config.server.host.isEmpty()) {
        m_error = QStringLiteral("host must not be empty");
        return false;
    }

    if (config.server.port < 0 || config.server.port > 65535) {
        m_error = QStringLiteral("port out of range (0-65535): %1").arg(config.server.port);
        return false;
    }

    LogManager::Level level;
    if (!LogManager::parseLevel(config.logging.level, &level)) {
        m_error = QStringLiteral("unknown logging.level: %1").arg(config.logging.level);
        return false;
    }

    return true;
}

QJsonObject ConfigStore::mergeObjects(const QJsonObject& base, const QJsonObject& overlay) {
    QJsonObject merged = base;
    for (auto it = overlay.constBegin(); it != overlay.constEnd(); ++it) {
        const QJsonValue existing = merged.value(it.key());
        if (existing.isObject() && it.value().isObject()) {
            merged[it.key()] = mergeObjects(existing.toObject(), it.value().toObject());
        } else {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

QString ConfigStore::encodeApiKey(const QString& plain) {
    if (plain.isEmpty()) {
        return QString();
    }
    return QStringLiteral("ENC:") + QString::fromUtf8(plain.toUtf8().toBase64());
}

QString ConfigStore::decodeApiKey(const QString& stored) {
    if (stored.startsWith(QStringLiteral("ENC:")))
        return QString::fromUtf8(QByteArray::fromBase64(stored.mid(4).toUtf8()));
    return stored;
}
