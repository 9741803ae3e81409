#pragma once

#include <QDateTime>
#include <QString>
#include <QStringView>
#include "collector.hpp"

/**
 * RssCollector: RSS/Atom через feedpp.
 * feedpp::parser::global_init() вызывается один раз в main.
 */
class RssCollector : public Collector {
public:
    explicit RssCollector(int timeoutSec = 7, QString userAgent = QStringLiteral("NewsRefresher/1.0"));

    QString type() const override { return QStringLiteral("rss"); }

    RawArticleList collect(const NewsSource& source,
                           const ProgressFn& onProgress,
                           const CancelledFn& isCancelled) override;

    StatusResult checkStatus(const NewsSource& source) override;

    // Грубое определение языка по первой "маркерной" букве
    static QString languageCheck(QStringView text);
    // Дата публикации: текстовая (RFC2822/ISO) или числовая (s/ms/µs/ns), иначе сейчас
    static QDateTime parsePublishedAtUtc(const QString& text, qint64 timestamp);

private:
    int timeout_;
    QString userAgent_;
};
