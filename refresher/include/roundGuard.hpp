#pragma once

#include <QMutex>
#include <QWaitCondition>

// Single-flight: не больше одного раунда одного вида одновременно.
class RoundGuard {
public:
    // Idle -> Running; false, если раунд уже идёт
    bool tryBegin();
    // Running -> Idle, будит ждущих
    void finish();
    bool isRunning() const;
    // msecs < 0: ждать бесконечно
    bool waitIdle(int msecs = -1) const;

private:
    enum class State { Idle, Running };

    mutable QMutex mtx_;
    mutable QWaitCondition idle_;
    State state_ = State::Idle;
};

// Снимает флаг занятости при выходе из области видимости задачи
class RoundGuardRelease {
public:
    explicit RoundGuardRelease(RoundGuard& guard) : guard_(guard) {}
    ~RoundGuardRelease() { guard_.finish(); }

    RoundGuardRelease(const RoundGuardRelease&) = delete;
    RoundGuardRelease& operator=(const RoundGuardRelease&) = delete;

private:
    RoundGuard& guard_;
};
