#pragma once

#include <QObject>
#include <QList>
#include <QString>
#include <QThreadPool>
#include <memory>
#include "cancellationFlag.hpp"
#include "newsSource.hpp"
#include "roundGuard.hpp"

class CollectorRegistry;
class HealthStoreFactory;

// Откуда брать "все включённые" источники, если список не передан явно
class SourceProvider {
public:
    virtual ~SourceProvider() = default;
    virtual QList<NewsSource> sources() const = 0;
};

/**
 * RefreshOrchestrator: координатор раундов обновления и проверки статусов.
 *  - не больше одного раунда каждого вида (refresh и status-check независимы)
 *  - отмена кооперативная: флаг, который опрашивают воркеры и коллекторы
 *  - события раунда испускаются из фоновых потоков; получатели в других
 *    потоках получают их через очередь своего event loop
 */
class RefreshOrchestrator : public QObject {
    Q_OBJECT
public:
    RefreshOrchestrator(const SourceProvider& provider,
                        std::shared_ptr<const CollectorRegistry> registry,
                        std::shared_ptr<HealthStoreFactory> stores,
                        QThreadPool* pool = nullptr,
                        QObject* parent = nullptr);
    ~RefreshOrchestrator() override;

    void setMaxWorkers(int workers);
    int maxWorkers() const { return maxWorkers_; }

    bool isRefreshing() const;
    bool isCheckingStatus() const;

    bool waitForRefresh(int msecs = -1) const;
    bool waitForStatusCheck(int msecs = -1) const;

public slots:
    // false: раунд уже идёт, запрос проигнорирован
    bool refreshAll();
    bool refreshSources(const QList<NewsSource>& sources);
    bool checkAllStatuses();

    void cancelRefresh();
    void cancelStatusCheck();

signals:
    void refreshStarted();
    void sourceRefreshed(const QString& sourceName, const RawArticleList& articles);
    void sourceRefreshProgress(const QString& sourceName, int percent, int total, int processed);
    void collectorProgress(const QString& sourceName, int done, int total);
    void sourceError(const QString& sourceName, const QString& message);
    void refreshCompleted(bool success, const QString& message);
    void refreshBusy();

    void statusCheckStarted();
    void sourceStatusChecked(const StatusResult& result);
    void allStatusesChecked(const QList<StatusResult>& results);
    void statusCheckFinished();
    void statusCheckBusy();

    void statusMessage(const QString& message);

private:
    static QList<NewsSource> enabledOnly(const QList<NewsSource>& sources);

    const SourceProvider& provider_;
    std::shared_ptr<const CollectorRegistry> registry_;
    std::shared_ptr<HealthStoreFactory> stores_;
    QThreadPool* pool_;
    int maxWorkers_;

    RoundGuard refreshGuard_;
    CancellationFlag refreshCancel_;
    RoundGuard statusGuard_;
    CancellationFlag statusCancel_;

    // пул координаторов по умолчанию; разрушается первым и ждёт задачи
    QThreadPool ownPool_;
};
