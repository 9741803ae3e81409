#pragma once

#include <functional>
#include <QString>
#include "newsSource.hpp"

/**
 * Collector: стратегия получения новостей для одного типа источника.
 * Ошибки сообщает исключениями (std::exception), как это делает feedpp.
 */
class Collector {
public:
    using ProgressFn  = std::function<void(int done, int total)>;
    using CancelledFn = std::function<bool()>;

    virtual ~Collector() = default;

    virtual QString type() const = 0;

    // isCancelled: только подсказка: при true стоит вернуть то, что уже собрано
    virtual RawArticleList collect(const NewsSource& source,
                                   const ProgressFn& onProgress,
                                   const CancelledFn& isCancelled) = 0;

    virtual bool supportsStatusCheck() const { return true; }
    virtual StatusResult checkStatus(const NewsSource& source) = 0;
};
