#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    InvalidInput,      // 400
    Unauthorized,      // 401
    NotFound,          // 404
    MethodNotAllowed,  // 405
    PayloadTooLarge,   // 413
    RateLimited,       // 429
    Internal,          // 500
    NotSupported,      // 501
    BadGateway,        // 502
    Unavailable,       // 503
    Timeout            // 504
};

enum class RouteKind : quint8 {
    ChatCompletions, ListModels
};
