#include "refreshTask.hpp"
#include "cancellationFlag.hpp"
#include "collector.hpp"
#include "collectorRegistry.hpp"
#include "roundGuard.hpp"
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QThreadPool>
#include <QWaitCondition>
#include <algorithm>
#include <exception>

namespace {

// Воркеры кладут результаты по мере готовности, координатор забирает их
// в порядке завершения, а не отправки
template <typename T>
class CompletionQueue {
public:
    void push(T item) {
        QMutexLocker lk(&mtx_);
        items_.enqueue(std::move(item));
        ready_.wakeOne();
    }

    T take() {
        QMutexLocker lk(&mtx_);
        while (items_.isEmpty())
            ready_.wait(&mtx_);
        return items_.dequeue();
    }

private:
    QMutex mtx_;
    QWaitCondition ready_;
    QQueue<T> items_;
};

} // namespace

RefreshTask::RefreshTask(QList<NewsSource> sources,
                         std::shared_ptr<const CollectorRegistry> registry,
                         CancellationFlag& cancel,
                         RoundGuard& guard,
                         int maxWorkers)
    : sources_(std::move(sources))
    , registry_(std::move(registry))
    , cancel_(cancel)
    , guard_(guard)
    , maxWorkers_(maxWorkers)
{
    setAutoDelete(true);
}

int RefreshTask::workerCount(int sourceCount, int ceiling)
{
    const int cap = std::clamp(ceiling, 1, kMaxRoundWorkers);
    return std::min(std::max(1, sourceCount), cap);
}

void RefreshTask::run()
{
    // объявлен первым: разрушится последним, уже после refreshCompleted
    RoundGuardRelease release(guard_);

    qInfo() << "[RefreshTask] refreshing" << sources_.size() << "sources";
    emit statusMessage(QString("Refreshing %1 sources...").arg(sources_.size()));

    Summary summary;
    try {
        fanOut(summary);
    } catch (const std::exception& e) {
        qWarning() << "[RefreshTask] unexpected error during fan-out:" << e.what();
        summary.failures << QString("fan-out error: %1").arg(QString::fromUtf8(e.what()));
    }

    bool success = false;
    const QString message = finalMessage(summary, success);
    qInfo() << "[RefreshTask]" << message;

    emit refreshCompleted(success, message);
    emit statusMessage(message);
}

void RefreshTask::fanOut(Summary& summary)
{
    const int total = sources_.size();
    const int workers = workerCount(total, maxWorkers_);
    qDebug() << "[RefreshTask] using" << workers << "workers";

    // очередь объявлена раньше пула: пул в деструкторе дождётся своих задач
    CompletionQueue<UnitOutcome> done;
    QThreadPool pool;
    pool.setMaxThreadCount(workers);

    int processed = 0;
    int submitted = 0;

    for (int i = 0; i < total; ++i) {
        const NewsSource& src = sources_.at(i);

        if (cancel_.isSet()) {
            qDebug() << "[RefreshTask] cancelled before submit:" << src.name;
            reportProgress(src.name, ++processed, total);
            reportSkipped(src.name, summary);
            continue;
        }

        std::shared_ptr<Collector> collector = registry_->resolve(src.type);
        if (!collector) {
            const QString err = QString("no collector registered for type '%1'").arg(src.type);
            qWarning() << "[RefreshTask] source" << src.name << ":" << err;
            summary.failures << QString("%1: %2").arg(src.name, err);
            reportProgress(src.name, ++processed, total);
            emit sourceError(src.name, err);
            continue;
        }

        pool.start([this, &done, i, src, collector] {
            done.push(collectOne(i, src, *collector));
        });
        ++submitted;
    }

    qDebug() << "[RefreshTask] submitted" << submitted << "of" << total;

    for (int n = 0; n < submitted; ++n) {
        UnitOutcome out = done.take();
        const QString& name = sources_.at(out.index).name;
        reportProgress(name, ++processed, total);

        if (out.kind == UnitKind::Skipped || cancel_.isSet()) {
            reportSkipped(name, summary);
            continue;
        }

        if (out.kind == UnitKind::Failed) {
            qWarning() << "[RefreshTask] source" << name << "failed:" << out.error;
            summary.failures << QString("%1: %2").arg(name, out.error);
            emit sourceError(name, out.error);
            continue;
        }

        qDebug() << "[RefreshTask] source" << name << "collected" << out.articles.size() << "items";
        summary.collected += out.articles.size();
        emit sourceRefreshed(name, out.articles);
    }
}

RefreshTask::UnitOutcome RefreshTask::collectOne(int index, const NewsSource& source, Collector& collector)
{
    UnitOutcome out;
    out.index = index;

    // источник мог простоять в очереди пула до отмены: тогда не начинаем
    if (cancel_.isSet()) {
        out.kind = UnitKind::Skipped;
        return out;
    }

    const QString name = source.name;
    try {
        out.articles = collector.collect(
            source,
            [this, name](int doneItems, int totalItems) { emit collectorProgress(name, doneItems, totalItems); },
            [this] { return cancel_.isSet(); });
        out.kind = UnitKind::Collected;
    } catch (const std::exception& e) {
        out.kind = UnitKind::Failed;
        out.error = QString::fromUtf8(e.what());
    } catch (...) {
        out.kind = UnitKind::Failed;
        out.error = QStringLiteral("unknown collector error");
    }
    return out;
}

void RefreshTask::reportProgress(const QString& sourceName, int processed, int total)
{
    const int percent = total > 0 ? processed * 100 / total : 100;
    emit sourceRefreshProgress(sourceName, percent, total, processed);
    emit statusMessage(QString("Refreshing: %1 (%2/%3)").arg(sourceName).arg(processed).arg(total));
}

void RefreshTask::reportSkipped(const QString& sourceName, Summary& summary)
{
    summary.cancelObserved = true;
    emit sourceRefreshed(sourceName, {});
}

QString RefreshTask::finalMessage(const Summary& summary, bool& success) const
{
    if (summary.cancelObserved || cancel_.isSet()) {
        success = false;
        return QString("Refresh cancelled by user (%1 items collected before cancellation).")
            .arg(summary.collected);
    }
    if (!summary.failures.isEmpty()) {
        success = false;
        return QString("Refresh finished with errors: %1").arg(summary.failures.join("; "));
    }
    success = true;
    return QString("Refresh complete (%1 new items).").arg(summary.collected);
}
