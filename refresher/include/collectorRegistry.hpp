#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

class Collector;

// Фабрика коллекторов: тип источника -> новый экземпляр на каждый запрос
class CollectorRegistry {
public:
    using Factory = std::function<std::shared_ptr<Collector>()>;

    // Регистрирует или переопределяет тип (регистр не важен)
    void registerCollector(const QString& sourceType, Factory factory);
    bool contains(const QString& sourceType) const;
    QStringList types() const;

    // nullptr, если тип не зарегистрирован или фабрика упала
    std::shared_ptr<Collector> resolve(const QString& sourceType) const;

private:
    mutable QMutex mtx_;
    QHash<QString, Factory> factories_;
};
