#include "failure.h"
#include <QJsonDocument>

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:     return 400;
    case ErrorKind::Unauthorized:     return 401;
    case ErrorKind::NotFound:         return 404;
    case ErrorKind::MethodNotAllowed: return 405;
    case ErrorKind::PayloadTooLarge:  return 413;
    case ErrorKind::RateLimited:      return 429;
    case ErrorKind::NotSupported:     return 501;
    case ErrorKind::BadGateway:       return 502;
    case ErrorKind::Unavailable:      return 503;
    case ErrorKind::Timeout:          return 504;
    case ErrorKind::Internal:
    default:                          return 500;
    }
}

// OpenAI-style error envelope so SDK clients surface the message.
QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["message"] = message;
    err["type"] = code;
    err["code"] = httpStatus();
    if (!details.isEmpty())
        err["details"] = details;
    QJsonObject root;
    root["error"] = err;
    return root;
}

QByteArray DomainFailure::toJsonBytes() const {
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg,
                                          const QString& details) {
    return {ErrorKind::InvalidInput, code, msg, details};
}

DomainFailure DomainFailure::unauthorized(const QString& msg) {
    return {ErrorKind::Unauthorized, "unauthorized", msg, {}};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::NotFound, "not_found", msg, {}};
}

DomainFailure DomainFailure::methodNotAllowed(const QString& msg) {
    return {ErrorKind::MethodNotAllowed, "method_not_allowed", msg, {}};
}

DomainFailure DomainFailure::payloadTooLarge(const QString& msg) {
    return {ErrorKind::PayloadTooLarge, "payload_too_large", msg, {}};
}

DomainFailure DomainFailure::notSupported(const QString& code, const QString& msg) {
    return {ErrorKind::NotSupported, code, msg, {}};
}

DomainFailure DomainFailure::badGateway(const QString& msg, const QString& details) {
    return {ErrorKind::BadGateway, "bad_gateway", msg, details};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, {}};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, {}};
}

DomainFailure DomainFailure::internal(const QString& msg, const QString& details) {
    return {ErrorKind::Internal, "internal", msg, details};
}
