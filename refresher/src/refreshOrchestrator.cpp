#include "refreshOrchestrator.hpp"
#include "collectorRegistry.hpp"
#include "healthStore.hpp"
#include "refreshTask.hpp"
#include "statusCheckTask.hpp"
#include <QDebug>
#include <QThreadPool>
#include <algorithm>

RefreshOrchestrator::RefreshOrchestrator(const SourceProvider& provider,
                                         std::shared_ptr<const CollectorRegistry> registry,
                                         std::shared_ptr<HealthStoreFactory> stores,
                                         QThreadPool* pool,
                                         QObject* parent)
    : QObject(parent)
    , provider_(provider)
    , registry_(std::move(registry))
    , stores_(std::move(stores))
    , pool_(pool ? pool : &ownPool_)
    , maxWorkers_(kMaxRoundWorkers)
{
    // по координатору на вид раунда
    ownPool_.setMaxThreadCount(2);

    // для queued-доставки событий в поток получателя
    qRegisterMetaType<RawArticleList>("RawArticleList");
    qRegisterMetaType<StatusResult>("StatusResult");
    qRegisterMetaType<QList<StatusResult>>("QList<StatusResult>");
}

RefreshOrchestrator::~RefreshOrchestrator()
{
    // задачи держат ссылки на флаги и guard'ы этого объекта
    refreshCancel_.set();
    statusCancel_.set();
    refreshGuard_.waitIdle();
    statusGuard_.waitIdle();
}

void RefreshOrchestrator::setMaxWorkers(int workers)
{
    maxWorkers_ = std::clamp(workers, 1, kMaxRoundWorkers);
}

bool RefreshOrchestrator::isRefreshing() const
{
    return refreshGuard_.isRunning();
}

bool RefreshOrchestrator::isCheckingStatus() const
{
    return statusGuard_.isRunning();
}

bool RefreshOrchestrator::waitForRefresh(int msecs) const
{
    return refreshGuard_.waitIdle(msecs);
}

bool RefreshOrchestrator::waitForStatusCheck(int msecs) const
{
    return statusGuard_.waitIdle(msecs);
}

QList<NewsSource> RefreshOrchestrator::enabledOnly(const QList<NewsSource>& sources)
{
    QList<NewsSource> out;
    out.reserve(sources.size());
    for (const auto& s : sources)
        if (s.enabled) out.append(s);
    return out;
}

bool RefreshOrchestrator::refreshAll()
{
    return refreshSources(provider_.sources());
}

bool RefreshOrchestrator::refreshSources(const QList<NewsSource>& sources)
{
    if (!refreshGuard_.tryBegin()) {
        qInfo() << "[RefreshOrchestrator] refresh already in progress, request ignored";
        emit refreshBusy();
        emit statusMessage(QStringLiteral("Refresh already in progress..."));
        return false;
    }

    refreshCancel_.clear();
    emit refreshStarted();

    QList<NewsSource> toRefresh = enabledOnly(sources);
    if (toRefresh.isEmpty()) {
        qInfo() << "[RefreshOrchestrator] no enabled sources to refresh";
        const QString msg = QStringLiteral("No enabled sources to refresh.");
        emit refreshCompleted(true, msg);
        emit statusMessage(msg);
        refreshGuard_.finish();
        return true;
    }

    qInfo() << "[RefreshOrchestrator] starting refresh of" << toRefresh.size() << "sources";

    auto* task = new RefreshTask(std::move(toRefresh), registry_, refreshCancel_, refreshGuard_, maxWorkers_);
    // DirectConnection: сигналы задачи сразу становятся сигналами оркестратора,
    // дальше Qt сам доставит их получателям в их потоки
    connect(task, &RefreshTask::sourceRefreshed,       this, &RefreshOrchestrator::sourceRefreshed,       Qt::DirectConnection);
    connect(task, &RefreshTask::sourceRefreshProgress, this, &RefreshOrchestrator::sourceRefreshProgress, Qt::DirectConnection);
    connect(task, &RefreshTask::collectorProgress,     this, &RefreshOrchestrator::collectorProgress,     Qt::DirectConnection);
    connect(task, &RefreshTask::sourceError,           this, &RefreshOrchestrator::sourceError,           Qt::DirectConnection);
    connect(task, &RefreshTask::statusMessage,         this, &RefreshOrchestrator::statusMessage,         Qt::DirectConnection);
    connect(task, &RefreshTask::refreshCompleted,      this, &RefreshOrchestrator::refreshCompleted,      Qt::DirectConnection);

    pool_->start(task);
    return true;
}

bool RefreshOrchestrator::checkAllStatuses()
{
    if (!statusGuard_.tryBegin()) {
        qInfo() << "[RefreshOrchestrator] status check already in progress, request ignored";
        emit statusCheckBusy();
        emit statusMessage(QStringLiteral("Status check already in progress..."));
        return false;
    }

    statusCancel_.clear();
    emit statusCheckStarted();

    QList<NewsSource> toCheck = enabledOnly(provider_.sources());
    if (toCheck.isEmpty()) {
        qInfo() << "[RefreshOrchestrator] no enabled sources to check";
        emit allStatusesChecked({});
        emit statusMessage(QStringLiteral("No enabled sources to check."));
        emit statusCheckFinished();
        statusGuard_.finish();
        return true;
    }

    qInfo() << "[RefreshOrchestrator] starting status check of" << toCheck.size() << "sources";

    auto* task = new StatusCheckTask(std::move(toCheck), registry_, stores_, statusCancel_, statusGuard_, maxWorkers_);
    connect(task, &StatusCheckTask::sourceStatusChecked, this, &RefreshOrchestrator::sourceStatusChecked, Qt::DirectConnection);
    connect(task, &StatusCheckTask::allStatusesChecked,  this, &RefreshOrchestrator::allStatusesChecked,  Qt::DirectConnection);
    connect(task, &StatusCheckTask::statusMessage,       this, &RefreshOrchestrator::statusMessage,       Qt::DirectConnection);
    connect(task, &StatusCheckTask::statusCheckFinished, this, &RefreshOrchestrator::statusCheckFinished, Qt::DirectConnection);

    pool_->start(task);
    return true;
}

void RefreshOrchestrator::cancelRefresh()
{
    if (refreshGuard_.isRunning()) {
        qInfo() << "[RefreshOrchestrator] cancelling refresh";
        refreshCancel_.set();
    } else {
        qDebug() << "[RefreshOrchestrator] no refresh to cancel";
    }
}

void RefreshOrchestrator::cancelStatusCheck()
{
    if (statusGuard_.isRunning()) {
        qInfo() << "[RefreshOrchestrator] cancelling status check";
        statusCancel_.set();
    } else {
        qDebug() << "[RefreshOrchestrator] no status check to cancel";
    }
}
