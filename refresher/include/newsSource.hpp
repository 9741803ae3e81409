#pragma once

#include <QString>
#include <QDateTime>
#include <QVariantMap>
#include <QList>
#include <QMetaType>
#include <optional>

enum class SourceStatus {
    Unchecked,
    Ok,
    Error
};

QString sourceStatusToString(SourceStatus status);
SourceStatus sourceStatusFromString(const QString& text);

// Сырая новость от коллектора: оркестратор её не разбирает, только считает и пересылает
using RawArticle     = QVariantMap;
using RawArticleList = QList<QVariantMap>;

struct NewsSource {
    std::optional<int> id;          // назначается БД при первой вставке
    QString name;
    QString type;                   // "rss", ...
    QString url;                    // может быть пустым
    QString category = QStringLiteral("uncategorized");
    bool enabled = true;
    QVariantMap customConfig;       // передаётся коллектору как есть

    // состояние здоровья: меняется только по событиям задач
    SourceStatus status = SourceStatus::Unchecked;
    QString lastError;
    QDateTime lastCheckedTime;
    int consecutiveErrorCount = 0;
};

struct StatusResult {
    std::optional<int> sourceId;
    QString sourceName;
    bool success = false;
    QString message;
    QString errorDetails;           // пусто, если ошибки нет
    QDateTime checkedAt;
    int consecutiveErrors = 0;

    SourceStatus status() const { return success ? SourceStatus::Ok : SourceStatus::Error; }
};

Q_DECLARE_METATYPE(NewsSource)
Q_DECLARE_METATYPE(StatusResult)
