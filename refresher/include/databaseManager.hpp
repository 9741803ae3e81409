#pragma once

#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlError>
#include <QString>
#include <QVariant>
#include <QList>
#include <optional>
#include "healthStore.hpp"
#include "newsSource.hpp"

/**
 * DBManager: именованное соединение с SQLite (QSQLITE).
 * Соединение QSqlDatabase нельзя делить между потоками:
 * каждый поток открывает свой DBManager со своим conn_name.
 */
class DBManager : public HealthStore {
public:
    DBManager(const QString& conn_name, const QString& db_path, const QString& driver = "QSQLITE");
    ~DBManager() override;

    bool open();
    void close() override;
    bool isOpen() const;
    const QString& connectionName() const { return conn_name_; }

    bool exec(const QString& queryStr);

    // источники
    std::optional<int> addSource(const NewsSource& source);
    bool updateSource(const NewsSource& source);
    bool removeSource(int id);
    std::optional<NewsSource> getSourceById(int id);
    std::optional<NewsSource> getSourceByName(const QString& name);
    QList<NewsSource> listSources();

    bool updateSourceHealth(int sourceId,
                            SourceStatus status,
                            const QString& lastError,
                            const QDateTime& checkedAt,
                            int consecutiveErrors) override;

    // статьи: дубликаты по link пропускаются, возвращает число вставленных (-1 при ошибке)
    int insertArticles(const RawArticleList& rows);
    int articleCount();

private:
    bool dbCheck();
    bool ensureSchema();
    std::optional<NewsSource> selectOneSource(const QString& where, const QVariant& value);

    QString conn_name_;
    QString db_path_;
    QSqlDatabase db;
};

// Каждый open(): новое соединение с уникальным именем
class SqlHealthStoreFactory : public HealthStoreFactory {
public:
    explicit SqlHealthStoreFactory(QString db_path);

    std::unique_ptr<HealthStore> open(const QString& connectionName) override;

private:
    QString db_path_;
};
