#include "roundGuard.hpp"
#include <QDeadlineTimer>
#include <QMutexLocker>

bool RoundGuard::tryBegin()
{
    QMutexLocker lk(&mtx_);
    if (state_ == State::Running)
        return false;
    state_ = State::Running;
    return true;
}

void RoundGuard::finish()
{
    QMutexLocker lk(&mtx_);
    state_ = State::Idle;
    idle_.wakeAll();
}

bool RoundGuard::isRunning() const
{
    QMutexLocker lk(&mtx_);
    return state_ == State::Running;
}

bool RoundGuard::waitIdle(int msecs) const
{
    QDeadlineTimer deadline = msecs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                        : QDeadlineTimer(msecs);
    QMutexLocker lk(&mtx_);
    while (state_ == State::Running) {
        if (!idle_.wait(&mtx_, deadline))
            return state_ == State::Idle;
    }
    return true;
}
