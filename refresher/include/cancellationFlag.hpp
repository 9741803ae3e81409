#pragma once

#include <atomic>

/**
 * CancellationFlag: кооперативный сигнал отмены раунда.
 *  - set()/clear() идемпотентны
 *  - isSet() не блокирует, его опрашивают воркеры между шагами
 * Принудительно потоки не останавливает.
 */
class CancellationFlag {
public:
    void set()   { flag_.store(true,  std::memory_order_release); }
    void clear() { flag_.store(false, std::memory_order_release); }
    bool isSet() const { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic_bool flag_{false};
};
