#pragma once

#include <QObject>
#include <QRunnable>
#include <QList>
#include <QString>
#include <QStringList>
#include <memory>
#include "newsSource.hpp"

class CancellationFlag;
class Collector;
class CollectorRegistry;
class RoundGuard;

constexpr int kMaxRoundWorkers = 8;   // источники упираются в сеть, а не в CPU

/**
 * RefreshTask: один раунд обновления: раздаёт источники ограниченному пулу,
 * на каждый источник выдаёт ровно одно терминальное событие
 * (sourceRefreshed или sourceError) и в конце refreshCompleted.
 * Флаг занятости раунда снимается последним шагом run().
 */
class RefreshTask : public QObject, public QRunnable {
    Q_OBJECT
public:
    RefreshTask(QList<NewsSource> sources,
                std::shared_ptr<const CollectorRegistry> registry,
                CancellationFlag& cancel,
                RoundGuard& guard,
                int maxWorkers = kMaxRoundWorkers);

    void run() override;

    static int workerCount(int sourceCount, int ceiling = kMaxRoundWorkers);

signals:
    void sourceRefreshed(const QString& sourceName, const RawArticleList& articles);
    void sourceRefreshProgress(const QString& sourceName, int percent, int total, int processed);
    void collectorProgress(const QString& sourceName, int done, int total);
    void sourceError(const QString& sourceName, const QString& message);
    void statusMessage(const QString& message);
    void refreshCompleted(bool success, const QString& message);

private:
    enum class UnitKind { Collected, Failed, Skipped };

    struct UnitOutcome {
        int index = -1;
        UnitKind kind = UnitKind::Skipped;
        RawArticleList articles;
        QString error;
    };

    struct Summary {
        int collected = 0;
        bool cancelObserved = false;
        QStringList failures;
    };

    void fanOut(Summary& summary);
    UnitOutcome collectOne(int index, const NewsSource& source, Collector& collector);
    void reportProgress(const QString& sourceName, int processed, int total);
    void reportSkipped(const QString& sourceName, Summary& summary);
    QString finalMessage(const Summary& summary, bool& success) const;

    QList<NewsSource> sources_;
    std::shared_ptr<const CollectorRegistry> registry_;
    CancellationFlag& cancel_;
    RoundGuard& guard_;
    int maxWorkers_;
};
