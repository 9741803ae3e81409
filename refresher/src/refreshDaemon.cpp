#include "refreshDaemon.hpp"
#include "collectorRegistry.hpp"
#include "databaseManager.hpp"
#include "refreshOrchestrator.hpp"
#include "rss_collector.hpp"
#include "sourceManager.hpp"
#include <QDebug>

std::shared_ptr<CollectorRegistry> RefreshDaemon::defaultRegistry(const Config& config)
{
    auto registry = std::make_shared<CollectorRegistry>();
    const int timeout = config.feed_timeout;
    const QString ua = config.user_agent;
    registry->registerCollector("rss", [timeout, ua] {
        return std::make_shared<RssCollector>(timeout, ua);
    });
    return registry;
}

RefreshDaemon::RefreshDaemon(const Config& config, QObject* parent)
    : RefreshDaemon(config, defaultRegistry(config), parent)
{}

RefreshDaemon::RefreshDaemon(const Config& config,
                             std::shared_ptr<CollectorRegistry> registry,
                             QObject* parent)
    : QObject(parent)
    , config_(config)
    , db_(std::make_unique<DBManager>("refresher_main", config.db_path))
    , sources_(std::make_unique<SourceManager>(*db_))
    , registry_(std::move(registry))
    , stores_(std::make_shared<SqlHealthStoreFactory>(config.db_path))
{
    orchestrator_ = std::make_unique<RefreshOrchestrator>(*sources_, registry_, stores_);
    orchestrator_->setMaxWorkers(config_.max_workers);

    connect(&refreshTimer_, &QTimer::timeout, this, &RefreshDaemon::tick);
    connect(&statusTimer_,  &QTimer::timeout, this, &RefreshDaemon::statusTick);

    // оркестратор шлёт из потоков пула: сюда события приходят через очередь
    connect(orchestrator_.get(), &RefreshOrchestrator::refreshStarted, this, [this] { storedInRound_ = 0; });
    connect(orchestrator_.get(), &RefreshOrchestrator::sourceRefreshed,     this, &RefreshDaemon::onSourceRefreshed);
    connect(orchestrator_.get(), &RefreshOrchestrator::sourceError,         this, &RefreshDaemon::onSourceError);
    connect(orchestrator_.get(), &RefreshOrchestrator::refreshCompleted,    this, &RefreshDaemon::onRefreshCompleted);
    connect(orchestrator_.get(), &RefreshOrchestrator::sourceStatusChecked, this, &RefreshDaemon::onSourceStatusChecked);
    connect(orchestrator_.get(), &RefreshOrchestrator::statusMessage, this, [](const QString& msg) {
        qDebug() << "[RefreshDaemon] status:" << msg;
    });
}

RefreshDaemon::~RefreshDaemon()
{
    stop();
    // оркестратор ждёт свои задачи, они читают sources_ и registry_
    orchestrator_.reset();
    sources_.reset();
    db_.reset();
}

bool RefreshDaemon::start()
{
    if (!db_->open()) {
        qWarning() << "[RefreshDaemon] cannot open DB" << config_.db_path;
        return false;
    }
    if (!sources_->load(config_.default_sources))
        return false;

    if (config_.lazy_time > 0) {
        refreshTimer_.start(static_cast<int>(config_.lazy_time * 1000));
        qInfo() << "[RefreshDaemon] auto refresh every" << config_.lazy_time << "s";
    } else {
        qInfo() << "[RefreshDaemon] auto refresh disabled";
    }

    if (config_.status_check_interval > 0) {
        statusTimer_.start(static_cast<int>(config_.status_check_interval * 1000));
        qInfo() << "[RefreshDaemon] status check every" << config_.status_check_interval << "s";
    }

    tick();
    return true;
}

void RefreshDaemon::stop()
{
    refreshTimer_.stop();
    statusTimer_.stop();
    if (!orchestrator_)
        return;

    orchestrator_->cancelRefresh();
    orchestrator_->cancelStatusCheck();
    orchestrator_->waitForRefresh();
    orchestrator_->waitForStatusCheck();
}

void RefreshDaemon::tick()
{
    qDebug() << "[RefreshDaemon] tick";
    // занятый оркестратор сам ответит refreshBusy
    orchestrator_->refreshAll();
}

void RefreshDaemon::statusTick()
{
    qDebug() << "[RefreshDaemon] status tick";
    orchestrator_->checkAllStatuses();
}

void RefreshDaemon::onSourceRefreshed(const QString& sourceName, const RawArticleList& articles)
{
    if (articles.isEmpty())
        return;

    const int inserted = db_->insertArticles(articles);
    if (inserted < 0) {
        qWarning() << "[RefreshDaemon] cannot store articles of" << sourceName;
        return;
    }
    storedInRound_ += inserted;
    qDebug() << "[RefreshDaemon]" << sourceName << ":" << inserted << "new of" << articles.size();
}

void RefreshDaemon::onSourceError(const QString& sourceName, const QString& message)
{
    qWarning() << "[RefreshDaemon] source" << sourceName << "failed:" << message;
}

void RefreshDaemon::onRefreshCompleted(bool success, const QString& message)
{
    if (success)
        qInfo() << "[RefreshDaemon]" << message << "stored:" << storedInRound_;
    else
        qWarning() << "[RefreshDaemon]" << message << "stored:" << storedInRound_;
}

void RefreshDaemon::onSourceStatusChecked(const StatusResult& result)
{
    sources_->applyStatusResult(result);
}
