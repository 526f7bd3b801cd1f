#pragma once

#include <chrono>

#include <QDateTime>

namespace worklog {

// Time source for SessionTimer. Interval accounting uses the monotonic
// instant; the wall-clock instant is only recorded for display and storage.
class SessionClock {
public:
    virtual ~SessionClock() = default;

    virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;
    virtual QDateTime wallNow() const = 0;
};

class SystemSessionClock : public SessionClock {
public:
    std::chrono::steady_clock::time_point monotonicNow() const override
    {
        return std::chrono::steady_clock::now();
    }

    QDateTime wallNow() const override
    {
        return QDateTime::currentDateTime();
    }
};

// Process-wide clock used when no clock is injected.
inline const SessionClock &systemSessionClock()
{
    static const SystemSessionClock clock;
    return clock;
}

} // namespace worklog
