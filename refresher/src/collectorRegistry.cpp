#include "collectorRegistry.hpp"
#include "collector.hpp"
#include <QDebug>
#include <QMutexLocker>
#include <exception>

static QString normType(const QString& t) {
    return t.trimmed().toLower();
}

void CollectorRegistry::registerCollector(const QString& sourceType, Factory factory)
{
    const QString key = normType(sourceType);
    QMutexLocker lk(&mtx_);
    if (factories_.contains(key))
        qWarning() << "[CollectorRegistry] overriding collector for type" << key;
    factories_.insert(key, std::move(factory));
    qDebug() << "[CollectorRegistry] registered type" << key;
}

bool CollectorRegistry::contains(const QString& sourceType) const
{
    QMutexLocker lk(&mtx_);
    return factories_.contains(normType(sourceType));
}

QStringList CollectorRegistry::types() const
{
    QMutexLocker lk(&mtx_);
    QStringList out = factories_.keys();
    out.sort();
    return out;
}

std::shared_ptr<Collector> CollectorRegistry::resolve(const QString& sourceType) const
{
    Factory factory;
    {
        QMutexLocker lk(&mtx_);
        auto it = factories_.constFind(normType(sourceType));
        if (it == factories_.constEnd()) {
            qWarning() << "[CollectorRegistry] no collector for type" << sourceType;
            return nullptr;
        }
        factory = it.value();
    }

    // фабрику зовём без блокировки: она может ходить в сеть/файлы
    try {
        return factory();
    } catch (const std::exception& e) {
        qWarning() << "[CollectorRegistry] factory for" << sourceType << "failed:" << e.what();
        return nullptr;
    }
}
