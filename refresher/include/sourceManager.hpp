#pragma once

#include <QObject>
#include <QList>
#include <QString>
#include <optional>
#include "newsSource.hpp"
#include "refreshOrchestrator.hpp"

class DBManager;

/**
 * SourceManager: кэш источников поверх БД.
 * Живёт в потоке своего DBManager; оркестратору отдаёт снимки через sources().
 */
class SourceManager : public QObject, public SourceProvider {
    Q_OBJECT
public:
    explicit SourceManager(DBManager& db, QObject* parent = nullptr);

    // Загружает источники; в пустую БД сначала записывает defaults
    bool load(const QList<NewsSource>& defaults = {});

    QList<NewsSource> sources() const override;
    std::optional<NewsSource> sourceByName(const QString& name) const;

    // Имя и тип обязательны, имя уникально; id назначает БД
    std::optional<int> addSource(NewsSource source, QString* errorOut = nullptr);
    bool removeSource(const QString& name);
    bool setSourceEnabled(const QString& name, bool enabled);

public slots:
    // Здоровье источника меняется только по событиям проверки
    void applyStatusResult(const StatusResult& result);

signals:
    void sourcesUpdated();

private:
    int indexOf(const QString& name) const;

    DBManager& db_;
    QList<NewsSource> sources_;
};
