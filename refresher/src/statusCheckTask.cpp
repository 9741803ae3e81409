#include "statusCheckTask.hpp"
#include "cancellationFlag.hpp"
#include "collector.hpp"
#include "collectorRegistry.hpp"
#include "healthStore.hpp"
#include "roundGuard.hpp"
#include <QDebug>
#include <QMutexLocker>
#include <QThreadPool>
#include <exception>

static std::atomic_int s_connectionSeq{0};

StatusCheckTask::StatusCheckTask(QList<NewsSource> sources,
                                 std::shared_ptr<const CollectorRegistry> registry,
                                 std::shared_ptr<HealthStoreFactory> stores,
                                 CancellationFlag& cancel,
                                 RoundGuard& guard,
                                 int maxWorkers)
    : sources_(std::move(sources))
    , registry_(std::move(registry))
    , stores_(std::move(stores))
    , cancel_(cancel)
    , guard_(guard)
    , maxWorkers_(maxWorkers)
{
    setAutoDelete(true);
}

void StatusCheckTask::run()
{
    RoundGuardRelease release(guard_);

    const int total = sources_.size();
    const int workers = RefreshTask::workerCount(total, maxWorkers_);
    qInfo() << "[StatusCheckTask] checking" << total << "sources with" << workers << "workers";
    emit statusMessage(QString("Checking status of %1 sources...").arg(total));

    {
        QThreadPool pool;
        pool.setMaxThreadCount(workers);
        for (int w = 0; w < workers; ++w)
            pool.start([this, w] { workerLoop(w); });
        pool.waitForDone();
    }

    QList<StatusResult> results;
    {
        QMutexLocker lk(&resultsMtx_);
        results = results_;
    }

    int failed = 0;
    for (const auto& r : results)
        if (!r.success) ++failed;

    QString message;
    if (cancel_.isSet())
        message = QString("Status check cancelled by user (%1 of %2 sources checked).")
                      .arg(results.size()).arg(total);
    else
        message = QString("Status check finished (%1 ok, %2 failed).")
                      .arg(results.size() - failed).arg(failed);
    qInfo() << "[StatusCheckTask]" << message;

    emit allStatusesChecked(results);
    emit statusMessage(message);
    emit statusCheckFinished();
}

void StatusCheckTask::workerLoop(int worker)
{
    // соединение с БД живёт ровно столько, сколько цикл этого воркера
    const QString connName = QString("refresher_status_%1").arg(s_connectionSeq.fetch_add(1));
    std::unique_ptr<HealthStore> store;
    try {
        store = stores_->open(connName);
    } catch (const std::exception& e) {
        qWarning() << "[StatusCheckTask] worker" << worker << "cannot open storage:" << e.what();
    } catch (...) {
        qWarning() << "[StatusCheckTask] worker" << worker << "cannot open storage: unknown exception";
    }
    if (!store)
        qWarning() << "[StatusCheckTask] worker" << worker << "runs without storage, results will not be persisted";

    for (;;) {
        if (cancel_.isSet()) {
            qInfo() << "[StatusCheckTask] worker" << worker << "stops: cancelled";
            break;
        }
        const int idx = next_.fetch_add(1);
        if (idx >= sources_.size())
            break;

        const NewsSource& src = sources_.at(idx);
        StatusResult result = probe(src, *registry_);
        persist(store.get(), src, result);

        if (result.success)
            qDebug() << "[StatusCheckTask]" << src.name << "ok:" << result.message;
        else
            qWarning() << "[StatusCheckTask]" << src.name << "failed (" << result.consecutiveErrors
                       << "in a row):" << result.errorDetails;

        {
            QMutexLocker lk(&resultsMtx_);
            results_.append(result);
        }
        emit sourceStatusChecked(result);
    }

    if (store)
        store->close();
}

StatusResult StatusCheckTask::probe(const NewsSource& source, const CollectorRegistry& registry)
{
    StatusResult r;
    std::shared_ptr<Collector> collector = registry.resolve(source.type);

    if (!collector) {
        r.message = QString("no collector registered for type '%1'").arg(source.type);
    } else if (!collector->supportsStatusCheck()) {
        r.message = QString("collector '%1' does not support status checks").arg(collector->type());
    } else {
        try {
            r = collector->checkStatus(source);
        } catch (const std::exception& e) {
            r = StatusResult{};
            r.message = QString("internal error during check: %1").arg(QString::fromUtf8(e.what()));
        } catch (...) {
            r = StatusResult{};
            r.message = QStringLiteral("internal error during check: unknown exception");
        }
    }

    r.sourceId = source.id;
    r.sourceName = source.name;
    if (!r.checkedAt.isValid())
        r.checkedAt = QDateTime::currentDateTimeUtc();

    if (r.success) {
        r.errorDetails.clear();
        if (r.message.isEmpty()) r.message = QStringLiteral("Check OK");
    } else {
        if (r.message.isEmpty()) r.message = QStringLiteral("Check failed");
        if (r.errorDetails.isEmpty()) r.errorDetails = r.message;
    }

    // политика одна на все типы: успех обнуляет, ошибка добавляет единицу
    r.consecutiveErrors = r.success ? 0 : source.consecutiveErrorCount + 1;
    return r;
}

void StatusCheckTask::persist(HealthStore* store, const NewsSource& source, StatusResult& result)
{
    QString failure;
    if (!source.id) {
        failure = QStringLiteral("not persisted: source has no id");
    } else if (!store) {
        failure = QStringLiteral("not persisted: storage unavailable");
    } else {
        try {
            if (!store->updateSourceHealth(*source.id, result.status(), result.errorDetails,
                                           result.checkedAt, result.consecutiveErrors))
                failure = QStringLiteral("DB update failed");
        } catch (const std::exception& e) {
            failure = QString("DB update exception: %1").arg(QString::fromUtf8(e.what()));
        } catch (...) {
            failure = QStringLiteral("DB update exception: unknown");
        }
    }

    if (failure.isEmpty())
        return;

    qWarning() << "[StatusCheckTask] cannot record status of" << source.name << ":" << failure;

    // проверку, которую не удалось записать, успешной не считаем
    if (result.success) {
        result.success = false;
        result.consecutiveErrors = source.consecutiveErrorCount + 1;
    }
    result.message += QString(" (%1)").arg(failure);
    result.errorDetails = result.errorDetails.isEmpty()
                              ? failure
                              : QString("%1 (%2)").arg(result.errorDetails, failure);
}
