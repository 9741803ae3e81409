#pragma once

#include <QObject>
#include <QRunnable>
#include <QList>
#include <QMutex>
#include <QString>
#include <atomic>
#include <memory>
#include "newsSource.hpp"
#include "refreshTask.hpp"

class CancellationFlag;
class CollectorRegistry;
class HealthStore;
class HealthStoreFactory;
class RoundGuard;

/**
 * StatusCheckTask: раунд проверки здоровья источников.
 *  - до kMaxRoundWorkers воркеров, каждый открывает СВОЙ хэндл хранилища
 *    на всё время цикла и закрывает его на выходе
 *  - счётчик подряд идущих ошибок считается здесь, а не в коллекторе
 *  - не удалось записать результат: результат считается ошибкой
 */
class StatusCheckTask : public QObject, public QRunnable {
    Q_OBJECT
public:
    StatusCheckTask(QList<NewsSource> sources,
                    std::shared_ptr<const CollectorRegistry> registry,
                    std::shared_ptr<HealthStoreFactory> stores,
                    CancellationFlag& cancel,
                    RoundGuard& guard,
                    int maxWorkers = kMaxRoundWorkers);

    void run() override;

    // Проверка одного источника без записи в хранилище
    static StatusResult probe(const NewsSource& source, const CollectorRegistry& registry);
    // Запись результата; при неудаче понижает result до ошибки
    static void persist(HealthStore* store, const NewsSource& source, StatusResult& result);

signals:
    void sourceStatusChecked(const StatusResult& result);
    void allStatusesChecked(const QList<StatusResult>& results);
    void statusMessage(const QString& message);
    void statusCheckFinished();

private:
    void workerLoop(int worker);

    QList<NewsSource> sources_;
    std::shared_ptr<const CollectorRegistry> registry_;
    std::shared_ptr<HealthStoreFactory> stores_;
    CancellationFlag& cancel_;
    RoundGuard& guard_;
    int maxWorkers_;

    std::atomic_int next_{0};
    QMutex resultsMtx_;
    QList<StatusResult> results_;
};
