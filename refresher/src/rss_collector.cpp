#include "rss_collector.hpp"
#include <QDebug>
#include <QChar>
#include <stdexcept>
#include "feedpp.h"

RssCollector::RssCollector(int timeoutSec, QString userAgent)
    : timeout_(timeoutSec)
    , userAgent_(std::move(userAgent))
{}

QString RssCollector::languageCheck(QStringView text)
{
    for (QChar ch : text) {
        if (!ch.isLetter())
            continue;

        const ushort u = ch.toLower().unicode();

        // кириллица "а".."я" + "ё"
        if ((u >= 0x0430 && u <= 0x044F) || u == 0x0451)
            return QStringLiteral("russian");

        // ä ö ü ß
        if (u == 0x00E4 || u == 0x00F6 || u == 0x00FC || u == 0x00DF)
            return QStringLiteral("german");

        // ñ á é í ó ú
        if (u == 0x00F1 || u == 0x00E1 || u == 0x00E9 ||
            u == 0x00ED || u == 0x00F3 || u == 0x00FA)
            return QStringLiteral("spanish");

        if (u >= 'a' && u <= 'z')
            return QStringLiteral("english");

        // CJK
        if (u >= 0x4E00 && u <= 0x9FFF)
            return QStringLiteral("chinese");
    }
    return QStringLiteral("unknown");
}

QDateTime RssCollector::parsePublishedAtUtc(const QString& text, qint64 timestamp)
{
    auto okRange = [](const QDateTime& d){
        return d.isValid() && d.date().year() >= 1990 && d.date().year() <= 2100;
    };

    const QString s = text.trimmed();
    if (!s.isEmpty()) {
        QDateTime dt = QDateTime::fromString(s, Qt::RFC2822Date);
        if (!dt.isValid()) dt = QDateTime::fromString(s, Qt::ISODate);
        if (!dt.isValid()) dt = QDateTime::fromString(s, Qt::ISODateWithMs);
        if (okRange(dt)) return dt.toUTC();
    }

    if (timestamp > 0) {
        const qint64 v = timestamp;
        QDateTime dt;
        if      (v >= 1'000'000'000'000'000'000LL) dt = QDateTime::fromMSecsSinceEpoch(v / 1'000'000, Qt::UTC); // ns→ms
        else if (v >=     100'000'000'000'000LL)   dt = QDateTime::fromMSecsSinceEpoch(v / 1'000,     Qt::UTC); // µs→ms
        else if (v >=       1'000'000'000'000LL)   dt = QDateTime::fromMSecsSinceEpoch(v,             Qt::UTC); // ms
        else                                       dt = QDateTime::fromSecsSinceEpoch(v,              Qt::UTC); // s
        if (okRange(dt)) return dt;
    }

    return QDateTime::currentDateTimeUtc();
}

RawArticleList RssCollector::collect(const NewsSource& source,
                                     const ProgressFn& onProgress,
                                     const CancelledFn& isCancelled)
{
    if (source.url.isEmpty())
        throw std::runtime_error("source URL is not configured");

    auto cancelled = [&isCancelled] { return isCancelled && isCancelled(); };
    if (cancelled()) {
        qDebug() << "[RssCollector]" << source.name << "cancelled before fetch";
        return {};
    }

    feedpp::parser p(timeout_, userAgent_.toStdString().c_str());
    feedpp::feed f = p.parse_url(source.url.toStdString());

    const QString feedLang = languageCheck(QString::fromStdString(f.title));

    int total = static_cast<int>(f.items.size());
    const int maxItems = source.customConfig.value("max_items", 0).toInt();
    if (maxItems > 0 && maxItems < total)
        total = maxItems;

    RawArticleList batch;
    batch.reserve(total);

    for (int i = 0; i < total; ++i) {
        // отдаём то, что успели собрать
        if (cancelled()) {
            qDebug() << "[RssCollector]" << source.name << "cancelled after" << i << "items";
            break;
        }

        const auto& it = f.items[static_cast<size_t>(i)];
        const QDateTime publishedAt = parsePublishedAtUtc(QString::fromStdString(it.pubDate),
                                                          static_cast<qint64>(it.pubDate_ts));

        QVariantMap row{
            {"title",        QString::fromStdString(it.title)},
            {"link",         QString::fromStdString(it.link)},
            {"summary",      QString::fromStdString(it.description)},
            {"guid",         QString::fromStdString(it.guid)},
            {"image_url",    QString::fromStdString(it.enclosure_url)},
            {"image_type",   QString::fromStdString(it.enclosure_type)},
            {"publish_time", publishedAt},
            {"language",     feedLang},
            {"source_name",  source.name},
            {"category",     source.category}
        };
        batch.push_back(std::move(row));

        if (onProgress)
            onProgress(i + 1, total);
    }

    qDebug() << "[RssCollector] source" << source.name << "parsed:" << batch.size() << "items";
    return batch;
}

StatusResult RssCollector::checkStatus(const NewsSource& source)
{
    StatusResult r;
    r.sourceId = source.id;
    r.sourceName = source.name;
    r.checkedAt = QDateTime::currentDateTimeUtc();

    if (source.url.isEmpty()) {
        r.success = false;
        r.message = QStringLiteral("source URL is not configured");
        r.errorDetails = r.message;
        qWarning() << "[RssCollector] status check of" << source.name << "failed:" << r.message;
        return r;
    }

    try {
        feedpp::parser p(timeout_, userAgent_.toStdString().c_str());
        feedpp::feed f = p.parse_url(source.url.toStdString());
        r.success = true;
        r.message = QString("Feed OK (%1 items)").arg(f.items.size());
    } catch (const std::exception& e) {
        r.success = false;
        r.message = QString("network or parse error: %1").arg(QString::fromUtf8(e.what()));
        r.errorDetails = r.message;
        qWarning() << "[RssCollector] status check of" << source.name << "failed:" << r.message;
    }
    r.checkedAt = QDateTime::currentDateTimeUtc();
    return r;
}
