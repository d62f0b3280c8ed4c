#ifndef RNMCPS_SESSION_TYPES_HPP
#define RNMCPS_SESSION_TYPES_HPP

// Shared value types of the session layer: statuses, log entries and the
// error taxonomy reported by every session operation.

#include <cstdint>
#include <string>

namespace session_types {

// Lifecycle of a supervised process. Transitions only move forward:
// Starting -> Running -> {Stopped | Error}.
enum class SessionStatus {
    Starting,
    Running,
    Stopped,
    Error
};

enum class LogLevel {
    Info,
    Warn,
    Error,
    Debug
};

// Failure classes. None means success.
enum class ErrorKind {
    None,
    SpawnFailure,
    SessionNotFound,
    SessionAlreadyExists,
    SessionNotRunning,
    ReadFailure,
    ReadinessTimeout,
    SignalNotFound,
    InvalidArgument,
    Cancelled
};

// One classified line of captured output. raw is stored as captured
// (UTF-8 sanitized); message and level are derived from it once, on append.
struct LogEntry {
    int64_t timestamp_ms = 0;
    LogLevel level = LogLevel::Info;
    std::string message;
    std::string raw;
};

std::string status_to_string(SessionStatus status);
std::string level_to_string(LogLevel level);
std::string error_kind_to_string(ErrorKind kind);

// True for Stopped and Error: the record no longer talks to its process.
bool is_finished(SessionStatus status);

} // namespace session_types

#endif // RNMCPS_SESSION_TYPES_HPP
