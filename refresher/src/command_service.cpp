#include "command_service.hpp"

#include <QJsonObject>
#include <QDebug>

#include "command_subscriber.hpp"
#include "refreshOrchestrator.hpp"
#include "sourceManager.hpp"
#include <sw/redis++/redis++.h>

CommandService::CommandService(RefreshOrchestrator& orchestrator,
                               SourceManager& sources,
                               QString redisUrl,
                               QString inChannel,
                               QString outChannel,
                               QObject* parent)
    : QObject(parent)
    , orchestrator_(orchestrator)
    , sources_(sources)
    , redisUrl_(std::move(redisUrl))
    , inChan_(std::move(inChannel))
    , outChan_(std::move(outChannel))
{
    wireOrchestrator();
}

CommandService::~CommandService() = default;

bool CommandService::start() {
    try {
        pub_ = std::make_unique<sw::redis::Redis>(redisOptionsFromUri(redisUrl_));
    } catch (const std::exception& e) {
        qWarning() << "[CommandService] Redis publisher init failed:" << e.what();
        return false;
    }

    sub_ = new CommandSubscriber(redisUrl_, inChan_, this);
    connect(sub_, &CommandSubscriber::commandReceived,  this, &CommandService::handleCommand);
    connect(sub_, &CommandSubscriber::malformedCommand, this, &CommandService::handleMalformed);
    connect(sub_, &CommandSubscriber::connected,   []{ qInfo()  << "[CommandService] subscriber connected"; });
    connect(sub_, &CommandSubscriber::disconnected,[](const QString& why){ qWarning() << "[CommandService] subscriber disconnected:" << why; });

    sub_->setReconnectDelay(200, 2000);
    sub_->start();

    qInfo() << "[CommandService] listening on" << inChan_ << "publishing to" << outChan_;
    emit started();
    return true;
}

void CommandService::wireOrchestrator() {
    RefreshOrchestrator* o = &orchestrator_;

    connect(o, &RefreshOrchestrator::refreshStarted, this, [this] {
        publishEvent("refresh_started");
    });
    connect(o, &RefreshOrchestrator::sourceRefreshed, this, [this](const QString& name, const RawArticleList& articles) {
        publishEvent("source_refreshed", {{"source_name", name}, {"count", static_cast<int>(articles.size())}});
    });
    connect(o, &RefreshOrchestrator::sourceRefreshProgress, this, [this](const QString& name, int percent, int total, int processed) {
        publishEvent("source_refresh_progress", {{"source_name", name}, {"percent", percent},
                                                 {"total", total}, {"processed", processed}});
    });
    connect(o, &RefreshOrchestrator::sourceError, this, [this](const QString& name, const QString& message) {
        publishEvent("source_error", {{"source_name", name}, {"error", message}});
    });
    connect(o, &RefreshOrchestrator::refreshCompleted, this, [this](bool success, const QString& message) {
        publishEvent("refresh_completed", {{"success", success}, {"message", message}});
    });
    connect(o, &RefreshOrchestrator::refreshBusy, this, [this] {
        publishEvent("refresh_busy");
    });

    connect(o, &RefreshOrchestrator::statusCheckStarted, this, [this] {
        publishEvent("status_check_started");
    });
    connect(o, &RefreshOrchestrator::sourceStatusChecked, this, [this](const StatusResult& r) {
        publishEvent("source_status_checked", statusResultToJson(r));
    });
    connect(o, &RefreshOrchestrator::allStatusesChecked, this, [this](const QList<StatusResult>& results) {
        publishEvent("all_statuses_checked", statusResultsToJson(results));
    });
    connect(o, &RefreshOrchestrator::statusCheckFinished, this, [this] {
        publishEvent("status_check_finished");
    });
    connect(o, &RefreshOrchestrator::statusCheckBusy, this, [this] {
        publishEvent("status_check_busy");
    });
}

void CommandService::handleCommand(const RefreshCommand& command) {
    switch (command.kind) {
    case RefreshCommand::Kind::Refresh: {
        if (command.sources.isEmpty()) {
            qInfo() << "[CommandService] refresh of all sources requested";
            orchestrator_.refreshAll();
            return;
        }

        QList<NewsSource> selected;
        for (const QString& name : command.sources) {
            if (auto s = sources_.sourceByName(name)) {
                selected.append(*s);
            } else {
                qWarning() << "[CommandService] unknown source in refresh command:" << name;
                publishEvent("error", {{"error", QString("unknown_source: %1").arg(name)}});
            }
        }
        qInfo() << "[CommandService] refresh of" << selected.size() << "sources requested";
        orchestrator_.refreshSources(selected);
        return;
    }
    case RefreshCommand::Kind::CheckStatus:
        if (!command.sources.isEmpty())
            qDebug() << "[CommandService] check_status ignores source list, checking all enabled";
        orchestrator_.checkAllStatuses();
        return;
    case RefreshCommand::Kind::CancelRefresh:
        orchestrator_.cancelRefresh();
        return;
    case RefreshCommand::Kind::CancelStatusCheck:
        orchestrator_.cancelStatusCheck();
        return;
    }
}

void CommandService::handleMalformed(const QString& error, const QByteArray& payload) {
    qWarning() << "[CommandService] bad payload:" << payload << "-" << error;
    publishEvent("error", {{"error", error}});
}

void CommandService::publishEvent(const QString& name, const QJsonObject& fields) {
    if (!publish(encodeEvent(name, fields)))
        qDebug() << "[CommandService] event" << name << "not published";
}

bool CommandService::publish(const QByteArray& json) {
    if (!pub_) return false;

    try {
        pub_->publish(outChan_.toStdString(), std::string(json.constData(), json.size()));
        return true;
    } catch (const std::exception& e) {
        qWarning() << "[CommandService] publish error:" << e.what();
        return false;
    }
}
