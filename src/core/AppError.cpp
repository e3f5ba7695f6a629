#include "AppError.h"

QString appErrorKindName(AppError::Kind kind)
{
    switch (kind) {
    case AppError::Kind::WebApi:     return QStringLiteral("WebApi");
    case AppError::Kind::Validation: return QStringLiteral("Validation");
    case AppError::Kind::Io:         return QStringLiteral("Io");
    case AppError::Kind::Parse:      return QStringLiteral("Parse");
    }
    return QStringLiteral("Unknown");
}

QDebug operator<<(QDebug dbg, const AppError& error)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "AppError(" << appErrorKindName(error.kind)
                  << ", " << error.message << ")";
    return dbg;
}
