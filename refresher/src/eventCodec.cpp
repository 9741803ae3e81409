#include "eventCodec.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

bool parseRefreshCommand(const QByteArray& payload, RefreshCommand& out, QString* errorOut)
{
    auto fail = [errorOut](const QString& why) {
        if (errorOut) *errorOut = why;
        return false;
    };

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &perr);
    if (perr.error != QJsonParseError::NoError)
        return fail(QString("bad_payload: %1").arg(perr.errorString()));
    if (!doc.isObject())
        return fail(QStringLiteral("bad_payload: not a JSON object"));

    const QJsonObject obj = doc.object();
    const QString command = obj.value("command").toString().trimmed().toLower();

    RefreshCommand cmd;
    if (command == "refresh")                  cmd.kind = RefreshCommand::Kind::Refresh;
    else if (command == "check_status")        cmd.kind = RefreshCommand::Kind::CheckStatus;
    else if (command == "cancel_refresh")      cmd.kind = RefreshCommand::Kind::CancelRefresh;
    else if (command == "cancel_status_check") cmd.kind = RefreshCommand::Kind::CancelStatusCheck;
    else if (command.isEmpty())
        return fail(QStringLiteral("bad_payload: missing command"));
    else
        return fail(QString("unknown_command: %1").arg(command));

    if (obj.contains("sources")) {
        const QJsonValue v = obj.value("sources");
        if (!v.isArray())
            return fail(QStringLiteral("bad_payload: sources must be an array"));
        for (const auto& item : v.toArray()) {
            if (!item.isString())
                return fail(QStringLiteral("bad_payload: source names must be strings"));
            const QString name = item.toString().trimmed();
            if (!name.isEmpty()) cmd.sources << name;
        }
    }

    out = cmd;
    return true;
}

QJsonObject statusResultToJson(const StatusResult& r)
{
    QJsonObject o{
        {"source_name",        r.sourceName},
        {"success",            r.success},
        {"status",             sourceStatusToString(r.status())},
        {"message",            r.message},
        {"checked_at",         r.checkedAt.toUTC().toString(Qt::ISODateWithMs)},
        {"consecutive_errors", r.consecutiveErrors}
    };
    if (r.sourceId)
        o.insert("source_id", *r.sourceId);
    if (!r.errorDetails.isEmpty())
        o.insert("error", r.errorDetails);
    return o;
}

QJsonObject statusResultsToJson(const QList<StatusResult>& results)
{
    QJsonArray arr;
    int ok = 0;
    for (const auto& r : results) {
        arr.append(statusResultToJson(r));
        if (r.success) ++ok;
    }
    return QJsonObject{
        {"results", arr},
        {"ok",      ok},
        {"failed",  static_cast<int>(results.size()) - ok}
    };
}

QByteArray encodeEvent(const QString& name, QJsonObject fields)
{
    fields.insert("event", name);
    return QJsonDocument(fields).toJson(QJsonDocument::Compact);
}
