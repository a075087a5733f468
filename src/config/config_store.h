#pragma once
#include "config_types.h"
#include <QJsonObject>
#include <QString>
#include <QStringList>

// Loads <dir>/default.json and overlays the optional <dir>/local.json.
class ConfigStore {
public:
    ConfigStore() = default;

    bool load(const QString& configDir);
    bool loadFromJson(const QJsonObject& root);

    const ProxyConfig& proxyConfig() const { return m_config; }
    const UpstreamConfig& upstream() const { return m_config.upstream; }
    const ServerConfig& server() const { return m_config.server; }
    const RuntimeOptions& runtime() const { return m_config.runtime; }

    QString errorString() const { return m_error; }
    QStringList loadedFiles() const { return m_loadedFiles; }

    static QJsonObject mergeObjects(const QJsonObject& base, const QJsonObject& overlay);
    static QString encodeApiKey(const QString& plain);
    static QString decodeApiKey(const QString& stored);

private:
    bool readJsonFile(const QString& path, QJsonObject* out);
    bool validate(const ProxyConfig& config);

    ProxyConfig m_config;
    QString m_error;
    QStringList m_loadedFiles;
};
