#ifndef RNMCPS_SESSION_SUPERVISOR_HPP
#define RNMCPS_SESSION_SUPERVISOR_HPP

// Session supervisor.
// Owns the process-wide registry of supervised processes. Each session has a
// capture thread that reads the child's stdout/stderr, splits the stream into
// classified log entries and records the exit. All operations report failure
// as data; none of them throws.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "session/session_types.hpp"

namespace session_supervisor {

using session_types::ErrorKind;
using session_types::LogEntry;
using session_types::SessionStatus;

constexpr std::size_t kDefaultLogCapacity = 1000;

// Registry-wide settings. Applied to sessions started after configure().
struct SupervisorSettings {
    std::size_t default_log_capacity = kDefaultLogCapacity;
    // Time between SIGTERM and SIGKILL when a stopped process lingers.
    int kill_grace_milliseconds = 5000;
    // Finished sessions older than this are reaped on the next start.
    int session_retention_milliseconds = 600000;
    // Empty = the server's working directory.
    std::string default_working_directory;
};

struct StartOptions {
    std::string cwd;                 // empty = default working directory
    std::size_t log_capacity = 0;    // 0 = settings default
    std::map<std::string, std::string> metadata;
};

struct SessionResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct ReadOutputResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::vector<LogEntry> logs;       // chronological
    SessionStatus status = SessionStatus::Error;
    std::size_t total_captured = 0;   // including evicted entries
};

struct StatusResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    SessionStatus status = SessionStatus::Error;
    int64_t uptime_ms = 0;
    std::size_t log_count = 0;
};

struct SessionInfo {
    std::string id;
    SessionStatus status = SessionStatus::Error;
    int64_t start_time_ms = 0;
    int64_t uptime_ms = 0;
    std::size_t log_count = 0;
    std::vector<std::string> command;
    std::string cwd;
};

struct MetadataResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::optional<std::string> value;
};

void configure(const SupervisorSettings &settings);
SupervisorSettings get_settings();

// Spawn command (argument vector, never a shell string) and register it under
// id. The record starts in Running. Rejects an id that is still registered.
SessionResult start_session(const std::string &id, const std::vector<std::string> &command,
                            const StartOptions &options = {});

// SIGTERM the process group and mark the session Stopped. A process that is
// still alive after the grace period gets SIGKILL. Idempotent.
SessionResult stop_session(const std::string &id);

// Write text plus a newline to the process's stdin. Fails once the session
// is no longer running.
SessionResult send_input(const std::string &id, const std::string &text);

// The last `tail` entries (0 = all) and the current status.
ReadOutputResult read_output(const std::string &id, std::size_t tail);

StatusResult get_status(const std::string &id);

std::vector<SessionInfo> list_sessions();

// Drop a finished session whose capture thread has completed.
SessionResult remove_session(const std::string &id);

// Remove finished sessions older than the retention window. Returns how many.
std::size_t reap_finished_sessions();

SessionResult set_metadata(const std::string &id, const std::string &key, const std::string &value);
MetadataResult get_metadata(const std::string &id, const std::string &key);

void stop_all_sessions();

// Stop everything, wait for every capture thread and empty the registry.
void shutdown();

} // namespace session_supervisor

#endif // RNMCPS_SESSION_SUPERVISOR_HPP
