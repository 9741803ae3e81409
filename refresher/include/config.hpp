#pragma once

#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cstdlib>
#include <QDebug>
#include <QString>
#include <QList>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "newsSource.hpp"
#include "refreshTask.hpp"

class Config
{
public:
    QJsonObject data;
    qint64 lazy_time = 60;               // seconds, 0: автообновление выключено
    qint64 status_check_interval = 0;    // seconds, 0: выключено
    int max_workers = kMaxRoundWorkers;
    QString db_path = "data/news.db";
    int feed_timeout = 7;
    QString user_agent = "NewsRefresher/1.0";
    QString redis_url = "redis://redis:6379/0";
    QString in_channel = "refresh_requests";
    QString out_channel = "refresh_events";
    QList<NewsSource> default_sources;
    QString path;

    Config()
    {
    }

    void parse(QString _path)
    {
        this->path = _path;
        readConfigFromFile(_path);

        lazy_time = data["lazy_time"].toInteger(lazy_time);
        status_check_interval = data["status_check_interval"].toInteger(status_check_interval);
        max_workers = std::clamp(data["max_workers"].toInt(max_workers), 1, kMaxRoundWorkers);
        db_path = data["db_path"].toString(db_path);
        feed_timeout = data["feed_timeout"].toInt(feed_timeout);
        user_agent = data["user_agent"].toString(user_agent);
        redis_url = data["redis_url"].toString(redis_url);
        in_channel = data["in_channel"].toString(in_channel);
        out_channel = data["out_channel"].toString(out_channel);

        default_sources.clear();
        for (const auto& v : data["default_sources"].toArray()) {
            const QJsonObject o = v.toObject();
            NewsSource s;
            s.name = o["name"].toString().trimmed();
            s.type = o["type"].toString("rss").trimmed().toLower();
            s.url = o["url"].toString();
            s.category = o["category"].toString(s.category);
            s.enabled = o["enabled"].toBool(true);
            s.customConfig = o["config"].toObject().toVariantMap();
            if (s.name.isEmpty()) {
                qWarning() << "[Config] default source without name skipped";
                continue;
            }
            default_sources.append(s);
        }

        applyEnvironment();
    }

    // Переменные окружения важнее файла
    void applyEnvironment()
    {
        if (const char* v = std::getenv("NEWS_DB_PATH"))
            db_path = QString::fromLocal8Bit(v);
        if (const char* v = std::getenv("REDIS_URL"))
            redis_url = QString::fromLocal8Bit(v);
        if (const char* v = std::getenv("REFRESH_IN_CHANNEL"))
            in_channel = QString::fromLocal8Bit(v);
        if (const char* v = std::getenv("REFRESH_OUT_CHANNEL"))
            out_channel = QString::fromLocal8Bit(v);
    }

private:
    void readConfigFromFile(QString path)
    {
        if(path.isEmpty()) throw std::runtime_error("config path empty");

        std::ifstream configFile(path.toStdString());
        if (!configFile.is_open()) {
            throw std::runtime_error("failed to open config file: " + path.toStdString());
        }

        std::string content((std::istreambuf_iterator<char>(configFile)),
                             std::istreambuf_iterator<char>());
        QJsonDocument doc = QJsonDocument::fromJson(QByteArray(content.c_str(), static_cast<int>(content.size())));
        if (doc.isNull() || !doc.isObject()) {
            throw std::runtime_error("failed to parse config JSON");
        }

        data = doc.object();
    }
};
