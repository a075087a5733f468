#pragma once
#include "domain/ports.h"
#include "proxy/connection_pool.h"
#include <QMap>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSslConfiguration>

class QtExecutor : public IExecutor {
public:
    QtExecutor(ConnectionPool& pool, const QSslConfiguration& sslConfig);
    ~QtExecutor() override;

    void execute(const ProviderRequest& request,
                 QObject* context,
                 ResponseCallback callback) override;
    void openStream(const ProviderRequest& request,
                    QObject* context,
                    StreamCallback callback) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    void setConnectionTimeout(int ms) { m_connectionTimeout = ms; }

    static DomainFailure mapTransportError(QNetworkReply* reply);

private:
    ConnectionPool& m_pool;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 120000;
    int m_connectionTimeout = 30000;

    struct StreamManager {
        QNetworkAccessManager* nam = nullptr;
        QMetaObject::Connection onDestroyed;
    };
    QMap<QNetworkReply*, StreamManager> m_streamManagers;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(QNetworkAccessManager* nam, const ProviderRequest& request) const;
    void startDeadline(QNetworkReply* reply, int timeoutMs) const;
    void adoptStreamManager(QNetworkReply* reply, QNetworkAccessManager* nam);
    static int statusCodeOf(QNetworkReply* reply);
    static QString contentTypeOf(QNetworkReply* reply);
};
