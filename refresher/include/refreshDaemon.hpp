#pragma once

#include <QObject>
#include <QTimer>
#include <QString>
#include <memory>
#include "config.hpp"
#include "newsSource.hpp"

class CollectorRegistry;
class DBManager;
class HealthStoreFactory;
class RefreshOrchestrator;
class SourceManager;

/**
 * RefreshDaemon: периодический планировщик.
 *  - по таймеру lazy_time запускает обновление всех источников
 *  - по таймеру status_check_interval запускает проверку статусов
 *  - события раундов получает в своём потоке: пишет статьи в БД,
 *    переносит результаты проверок в SourceManager
 */
class RefreshDaemon : public QObject {
    Q_OBJECT
public:
    explicit RefreshDaemon(const Config& config, QObject* parent = nullptr);
    RefreshDaemon(const Config& config,
                  std::shared_ptr<CollectorRegistry> registry,
                  QObject* parent = nullptr);
    ~RefreshDaemon() override;

    RefreshOrchestrator& orchestrator() { return *orchestrator_; }
    SourceManager& sourceManager() { return *sources_; }
    DBManager& database() { return *db_; }

    // Реестр по умолчанию: "rss" -> RssCollector
    static std::shared_ptr<CollectorRegistry> defaultRegistry(const Config& config);

public slots:
    bool start();
    void stop();

private slots:
    void tick();
    void statusTick();
    void onSourceRefreshed(const QString& sourceName, const RawArticleList& articles);
    void onSourceError(const QString& sourceName, const QString& message);
    void onRefreshCompleted(bool success, const QString& message);
    void onSourceStatusChecked(const StatusResult& result);

private:
    Config config_;
    std::unique_ptr<DBManager> db_;
    std::unique_ptr<SourceManager> sources_;
    std::shared_ptr<CollectorRegistry> registry_;
    std::shared_ptr<HealthStoreFactory> stores_;
    std::unique_ptr<RefreshOrchestrator> orchestrator_;

    QTimer refreshTimer_;
    QTimer statusTimer_;
    int storedInRound_ = 0;
};
