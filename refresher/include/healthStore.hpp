#pragma once

#include <QDateTime>
#include <QString>
#include <memory>
#include "newsSource.hpp"

// Хэндл к хранилищу для записи здоровья источников.
// Используется только в том потоке, который его открыл.
class HealthStore {
public:
    virtual ~HealthStore() = default;

    virtual bool updateSourceHealth(int sourceId,
                                    SourceStatus status,
                                    const QString& lastError,
                                    const QDateTime& checkedAt,
                                    int consecutiveErrors) = 0;
    virtual void close() = 0;
};

// Открывает отдельный хэндл на каждый воркер проверки статусов
class HealthStoreFactory {
public:
    virtual ~HealthStoreFactory() = default;

    // nullptr, если открыть не удалось
    virtual std::unique_ptr<HealthStore> open(const QString& connectionName) = 0;
};
