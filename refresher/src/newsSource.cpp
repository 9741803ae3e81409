#include "newsSource.hpp"

QString sourceStatusToString(SourceStatus status)
{
    switch (status) {
    case SourceStatus::Ok:    return QStringLiteral("ok");
    case SourceStatus::Error: return QStringLiteral("error");
    case SourceStatus::Unchecked:
        break;
    }
    return QStringLiteral("unchecked");
}

SourceStatus sourceStatusFromString(const QString& text)
{
    const QString s = text.trimmed().toLower();
    if (s == QLatin1String("ok"))    return SourceStatus::Ok;
    if (s == QLatin1String("error")) return SourceStatus::Error;
    return SourceStatus::Unchecked;
}
