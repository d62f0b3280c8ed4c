#include "session/session_types.hpp"

namespace session_types {

std::string status_to_string(SessionStatus status) {
    switch (status) {
    case SessionStatus::Starting:
        return "starting";
    case SessionStatus::Running:
        return "running";
    case SessionStatus::Stopped:
        return "stopped";
    case SessionStatus::Error:
        return "error";
    }
    return "error";
}

std::string level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Debug:
        return "debug";
    }
    return "info";
}

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::SpawnFailure:
        return "spawn_failure";
    case ErrorKind::SessionNotFound:
        return "session_not_found";
    case ErrorKind::SessionAlreadyExists:
        return "session_already_exists";
    case ErrorKind::SessionNotRunning:
        return "session_not_running";
    case ErrorKind::ReadFailure:
        return "read_failure";
    case ErrorKind::ReadinessTimeout:
        return "readiness_timeout";
    case ErrorKind::SignalNotFound:
        return "signal_not_found";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "none";
}

bool is_finished(SessionStatus status) {
    return status == SessionStatus::Stopped || status == SessionStatus::Error;
}

} // namespace session_types
