#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include "newsSource.hpp"

// Команда из входного Redis-канала
struct RefreshCommand {
    enum class Kind { Refresh, CheckStatus, CancelRefresh, CancelStatusCheck };

    Kind kind = Kind::Refresh;
    QStringList sources;   // пусто: все включённые
};

// false + errorOut, если payload не JSON-объект или команда неизвестна
bool parseRefreshCommand(const QByteArray& payload, RefreshCommand& out, QString* errorOut = nullptr);

QJsonObject statusResultToJson(const StatusResult& result);
QJsonObject statusResultsToJson(const QList<StatusResult>& results);

// {"event": name, ...fields} в компактном JSON
QByteArray encodeEvent(const QString& name, QJsonObject fields = {});
