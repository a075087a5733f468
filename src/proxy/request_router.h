#pragma once
#include "domain/types.h"
#include <QList>
#include <QString>
#include <QStringList>

struct Route {
    QString method;
    QString path;  // matched exactly
    RouteKind kind = RouteKind::ChatCompletions;
};

class RequestRouter {
public:
    enum class MatchStatus { Matched, NotFound, MethodNotAllowed };

    struct Match {
        MatchStatus status = MatchStatus::NotFound;
        Route route;
        QStringList allowedMethods;

        bool isMatched() const { return status == MatchStatus::Matched; }
    };

    void registerDefaults();
    void addRoute(const Route& route);
    Match match(const QString& method, const QString& path) const;
    int routeCount() const { return m_routes.size(); }

private:
    QList<Route> m_routes;
};
