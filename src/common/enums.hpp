#pragma once

namespace worklog {

enum class TimerState {
    Idle,
    Running,
    Paused
};

enum class ErrorCode {
    AlreadyRunning,
    NotRunning,
    NoActiveSession,
    CorruptStorage,
    StorageWriteFailed,
    IndexOutOfRange,
    InvalidFormat,
    EndBeforeStart,
    InvalidDateRange,
    NoRecordsInRange,
    ExportWriteFailed
};

} // namespace worklog
