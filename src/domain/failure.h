#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    QString     details;

    int httpStatus() const;
    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg,
                                      const QString& details = {});
    static DomainFailure unauthorized(const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure methodNotAllowed(const QString& msg);
    static DomainFailure payloadTooLarge(const QString& msg);
    static DomainFailure notSupported(const QString& code, const QString& msg);
    static DomainFailure badGateway(const QString& msg, const QString& details = {});
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg, const QString& details = {});
};
