#include "sourceManager.hpp"
#include "databaseManager.hpp"
#include <QDebug>

SourceManager::SourceManager(DBManager& db, QObject* parent)
    : QObject(parent)
    , db_(db)
{}

bool SourceManager::load(const QList<NewsSource>& defaults)
{
    if (!db_.isOpen() && !db_.open()) {
        qWarning() << "[SourceManager] DB is not available, sources not loaded";
        return false;
    }

    QList<NewsSource> stored = db_.listSources();
    if (stored.isEmpty() && !defaults.isEmpty()) {
        qInfo() << "[SourceManager] empty DB, seeding" << defaults.size() << "default sources";
        for (const auto& s : defaults) {
            if (!db_.addSource(s))
                qWarning() << "[SourceManager] cannot seed default source" << s.name;
        }
        stored = db_.listSources();
    }

    sources_ = stored;
    qInfo() << "[SourceManager] loaded" << sources_.size() << "sources";
    emit sourcesUpdated();
    return true;
}

QList<NewsSource> SourceManager::sources() const
{
    return sources_;
}

int SourceManager::indexOf(const QString& name) const
{
    for (int i = 0; i < sources_.size(); ++i)
        if (sources_.at(i).name == name) return i;
    return -1;
}

std::optional<NewsSource> SourceManager::sourceByName(const QString& name) const
{
    const int idx = indexOf(name);
    if (idx < 0) return std::nullopt;
    return sources_.at(idx);
}

std::optional<int> SourceManager::addSource(NewsSource source, QString* errorOut)
{
    source.name = source.name.trimmed();
    source.type = source.type.trimmed().toLower();

    QString err;
    if (source.name.isEmpty())
        err = QStringLiteral("source name is required");
    else if (source.type.isEmpty())
        err = QStringLiteral("source type is required");
    else if (indexOf(source.name) >= 0)
        err = QString("source '%1' already exists").arg(source.name);

    if (!err.isEmpty()) {
        qWarning() << "[SourceManager] addSource rejected:" << err;
        if (errorOut) *errorOut = err;
        return std::nullopt;
    }

    const std::optional<int> id = db_.addSource(source);
    if (!id) {
        if (errorOut) *errorOut = QStringLiteral("DB insert failed");
        return std::nullopt;
    }

    source.id = id;
    sources_.append(source);
    qInfo() << "[SourceManager] added source" << source.name << "id=" << *id;
    emit sourcesUpdated();
    return id;
}

bool SourceManager::removeSource(const QString& name)
{
    const int idx = indexOf(name);
    if (idx < 0) {
        qWarning() << "[SourceManager] removeSource: no source" << name;
        return false;
    }

    const NewsSource& s = sources_.at(idx);
    if (s.id && !db_.removeSource(*s.id)) {
        qWarning() << "[SourceManager] removeSource: DB delete failed for" << name;
        return false;
    }

    sources_.removeAt(idx);
    qInfo() << "[SourceManager] removed source" << name;
    emit sourcesUpdated();
    return true;
}

bool SourceManager::setSourceEnabled(const QString& name, bool enabled)
{
    const int idx = indexOf(name);
    if (idx < 0) {
        qWarning() << "[SourceManager] setSourceEnabled: no source" << name;
        return false;
    }

    NewsSource updated = sources_.at(idx);
    updated.enabled = enabled;
    if (!db_.updateSource(updated)) {
        qWarning() << "[SourceManager] setSourceEnabled: DB update failed for" << name;
        return false;
    }

    sources_[idx] = updated;
    emit sourcesUpdated();
    return true;
}

void SourceManager::applyStatusResult(const StatusResult& result)
{
    int idx = -1;
    for (int i = 0; i < sources_.size(); ++i) {
        const NewsSource& s = sources_.at(i);
        if ((result.sourceId && s.id == result.sourceId) ||
            (!result.sourceId && s.name == result.sourceName)) {
            idx = i;
            break;
        }
    }
    if (idx < 0) {
        qDebug() << "[SourceManager] status for unknown source" << result.sourceName;
        return;
    }

    NewsSource& s = sources_[idx];
    s.status = result.status();
    s.lastError = result.success ? QString() : result.errorDetails;
    s.lastCheckedTime = result.checkedAt;
    s.consecutiveErrorCount = result.consecutiveErrors;
    emit sourcesUpdated();
}
