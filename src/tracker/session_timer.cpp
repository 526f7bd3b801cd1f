#include "tracker/session_timer.hpp"

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

[[noreturn]] void rejectTransition(ErrorCode code,
                                   const QString &where,
                                   TimerState state,
                                   const std::string &message)
{
    WLOG_WARN(QStringLiteral("SessionTimer"),
              where,
              QStringLiteral("timer_transition_rejected"),
              QString::fromStdString(toErrorCodeString(code)),
              QStringLiteral("state_check"),
              (nlohmann::json{{"state", toTimerStateString(state)}}));
    throw WorklogError(code, message);
}

} // namespace

SessionTimer::SessionTimer(const SessionClock &clock)
    : m_clock(clock)
{
}

TimerState SessionTimer::stateLocked() const
{
    if (m_running) {
        return TimerState::Running;
    }
    if (m_sessionStart.has_value()) {
        return TimerState::Paused;
    }
    return TimerState::Idle;
}

void SessionTimer::commitSegmentLocked()
{
    const auto now = m_clock.monotonicNow();
    const std::chrono::duration<double> delta = now - *m_segmentStart;
    m_accumulatedSeconds += delta.count();
    m_segmentStart.reset();
    m_running = false;
}

void SessionTimer::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerState current = stateLocked();
    if (current != TimerState::Idle) {
        rejectTransition(ErrorCode::AlreadyRunning,
                         QStringLiteral("start"),
                         current,
                         "Timer is already running.");
    }

    m_sessionStart = m_clock.wallNow();
    m_segmentStart = m_clock.monotonicNow();
    m_accumulatedSeconds = 0.0;
    m_running = true;

    WLOG_INFO(QStringLiteral("SessionTimer"),
              QStringLiteral("start"),
              QStringLiteral("session_started"),
              QStringLiteral("user_action"),
              QStringLiteral("timer"),
              (nlohmann::json{{"start", toLocalIso(*m_sessionStart)}}));
}

void SessionTimer::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerState current = stateLocked();
    if (current != TimerState::Running) {
        rejectTransition(ErrorCode::NotRunning,
                         QStringLiteral("pause"),
                         current,
                         "No timer is running to pause.");
    }

    commitSegmentLocked();

    WLOG_INFO(QStringLiteral("SessionTimer"),
              QStringLiteral("pause"),
              QStringLiteral("session_paused"),
              QStringLiteral("user_action"),
              QStringLiteral("timer"),
              (nlohmann::json{{"accumulated", m_accumulatedSeconds}}));
}

void SessionTimer::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerState current = stateLocked();
    if (current == TimerState::Running) {
        rejectTransition(ErrorCode::AlreadyRunning,
                         QStringLiteral("resume"),
                         current,
                         "Timer is already running.");
    }
    if (current == TimerState::Idle) {
        rejectTransition(ErrorCode::NotRunning,
                         QStringLiteral("resume"),
                         current,
                         "No paused session to resume.");
    }

    m_segmentStart = m_clock.monotonicNow();
    m_running = true;

    WLOG_INFO(QStringLiteral("SessionTimer"),
              QStringLiteral("resume"),
              QStringLiteral("session_resumed"),
              QStringLiteral("user_action"),
              QStringLiteral("timer"),
              (nlohmann::json{{"accumulated", m_accumulatedSeconds}}));
}

FinalizedSession SessionTimer::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerState current = stateLocked();
    if (current == TimerState::Idle) {
        rejectTransition(ErrorCode::NoActiveSession,
                         QStringLiteral("stop"),
                         current,
                         "No active or paused session to stop.");
    }

    if (m_running) {
        commitSegmentLocked();
    }

    FinalizedSession session;
    session.startTimestamp = *m_sessionStart;
    session.endTimestamp = m_clock.wallNow();
    session.accumulatedSeconds = m_accumulatedSeconds;
    if (session.endTimestamp < session.startTimestamp) {
        // Wall clock moved backwards during the session; end at start + elapsed.
        const QDateTime clamped = session.startTimestamp.addMSecs(
            static_cast<qint64>(m_accumulatedSeconds * 1000.0));
        WLOG_WARN(QStringLiteral("SessionTimer"),
                  QStringLiteral("stop"),
                  QStringLiteral("end_time_clamped"),
                  QStringLiteral("wall_clock_behind_start"),
                  QStringLiteral("timer"),
                  (nlohmann::json{{"wall", toLocalIso(session.endTimestamp)},
                                  {"clamped", toLocalIso(clamped)}}));
        session.endTimestamp = clamped;
    }

    m_running = false;
    m_segmentStart.reset();
    m_sessionStart.reset();
    m_accumulatedSeconds = 0.0;

    WLOG_INFO(QStringLiteral("SessionTimer"),
              QStringLiteral("stop"),
              QStringLiteral("session_stopped"),
              QStringLiteral("user_action"),
              QStringLiteral("timer"),
              (nlohmann::json{{"start", toLocalIso(session.startTimestamp)},
                              {"end", toLocalIso(session.endTimestamp)},
                              {"elapsed", session.accumulatedSeconds}}));
    return session;
}

double SessionTimer::currentElapsed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        return m_accumulatedSeconds;
    }
    const std::chrono::duration<double> open = m_clock.monotonicNow() - *m_segmentStart;
    return m_accumulatedSeconds + open.count();
}

TimerState SessionTimer::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return stateLocked();
}

std::optional<QDateTime> SessionTimer::sessionStart() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessionStart;
}

std::string toTimerStateString(TimerState state)
{
    switch (state) {
    case TimerState::Idle:
        return "idle";
    case TimerState::Running:
        return "running";
    case TimerState::Paused:
        return "paused";
    }
    return "idle";
}

Record makeRecord(const FinalizedSession &session, const std::string &comment)
{
    Record record;
    record.startTime = toLocalIso(session.startTimestamp);
    record.endTime = toLocalIso(session.endTimestamp);
    record.elapsedSeconds = session.accumulatedSeconds;
    record.comment = comment;
    return record;
}

} // namespace worklog
