#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    // POST /v1/chat/completions -> forwarded upstream
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/chat/completions"),
              RouteKind::ChatCompletions});

    // GET /v1/models -> answered locally with the configured model
    addRoute({QStringLiteral("GET"), QStringLiteral("/v1/models"),
              RouteKind::ListModels});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    Route entry = route;
    entry.method = route.method.trimmed().toUpper();
    m_routes.append(entry);
}

RequestRouter::Match RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    Match result;

    for (const Route& route : m_routes) {
        if (route.path != path) {
            continue;
        }

        if (route.method == normalizedMethod) {
            result.status = MatchStatus::Matched;
            result.route = route;
            result.allowedMethods.clear();
            return result;
        }

        // Path is known; remember the methods it does accept for the Allow header.
        result.status = MatchStatus::MethodNotAllowed;
        if (!result.allowedMethods.contains(route.method))
            result.allowedMethods.append(route.method);
    }

    return result;
}
