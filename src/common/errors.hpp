#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace worklog {

inline std::string toErrorCodeString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::AlreadyRunning:
        return "already_running";
    case ErrorCode::NotRunning:
        return "not_running";
    case ErrorCode::NoActiveSession:
        return "no_active_session";
    case ErrorCode::CorruptStorage:
        return "corrupt_storage";
    case ErrorCode::StorageWriteFailed:
        return "storage_write_failed";
    case ErrorCode::IndexOutOfRange:
        return "index_out_of_range";
    case ErrorCode::InvalidFormat:
        return "invalid_format";
    case ErrorCode::EndBeforeStart:
        return "end_before_start";
    case ErrorCode::InvalidDateRange:
        return "invalid_date_range";
    case ErrorCode::NoRecordsInRange:
        return "no_records_in_range";
    case ErrorCode::ExportWriteFailed:
        return "export_write_failed";
    }
    return "unknown";
}

// Every failure raised by the core carries one of the ErrorCode values so
// callers can branch on the kind of failure and still show what() to a user.
class WorklogError : public std::runtime_error {
public:
    WorklogError(ErrorCode code, const std::string &message)
        : std::runtime_error(message)
        , m_code(code)
    {
    }

    ErrorCode code() const
    {
        return m_code;
    }

private:
    ErrorCode m_code;
};

} // namespace worklog
