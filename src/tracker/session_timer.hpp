#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <QDateTime>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "tracker/session_clock.hpp"

namespace worklog {

// SessionTimer tracks a single work session through
// Idle -> Running -> Paused -> Running ... -> Idle. Elapsed time only grows
// while Running; pause/resume cycles keep the accumulated total.
// Misuse throws WorklogError (AlreadyRunning, NotRunning, NoActiveSession)
// and leaves the state untouched.
class SessionTimer {
public:
    explicit SessionTimer(const SessionClock &clock = systemSessionClock());

    void start();
    void pause();
    void resume();
    FinalizedSession stop();

    // Safe to poll at any rate; never mutates the session.
    double currentElapsed() const;
    TimerState state() const;
    std::optional<QDateTime> sessionStart() const;

private:
    const SessionClock &m_clock;

    mutable std::mutex m_mutex;
    bool m_running = false;
    std::optional<std::chrono::steady_clock::time_point> m_segmentStart;
    std::optional<QDateTime> m_sessionStart;
    double m_accumulatedSeconds = 0.0;

    TimerState stateLocked() const;
    void commitSegmentLocked();
};

std::string toTimerStateString(TimerState state);

// Converts a finished session into the record that gets persisted.
Record makeRecord(const FinalizedSession &session, const std::string &comment);

} // namespace worklog
