#include "session/session_supervisor.hpp"
#include "session/session_log_buffer.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace session_supervisor {

using session_types::LogLevel;

// How long to keep reading after the child is reaped. A grandchild that
// inherited the pipes can hold them open indefinitely.
static constexpr int kDrainAfterExitMilliseconds = 500;
static constexpr int kPollTimeoutMilliseconds = 100;
static constexpr std::size_t kInputLogPreviewLength = 50;

// One supervised process. Only the supervisor holds it; the capture thread
// borrows a raw pointer and is joined before the record is destroyed.
struct SessionRecord {
    std::string id;
    std::vector<std::string> command;
    std::string cwd;
    int64_t start_time_ms = 0;
    int process_id = -1;
    int kill_grace_milliseconds = 5000;

    // Read ends; owned by the capture thread once it runs.
    int stdout_fd = -1;
    int stderr_fd = -1;

    // Everything below is guarded by mutex.
    std::mutex mutex;
    SessionStatus status = SessionStatus::Starting;
    int stdin_fd = -1;
    bool stop_requested = false;
    int64_t stop_requested_at_ms = 0;
    int64_t finished_at_ms = 0; // set when the capture thread is done
    session_log_buffer::LogBuffer logs;
    std::map<std::string, std::string> metadata;

    std::thread capture_thread;
};

struct Registry {
    std::mutex mutex;
    std::map<std::string, std::unique_ptr<SessionRecord>> sessions;
    SupervisorSettings settings;
};

// Module-level registry (process-wide, like the other module singletons).
static Registry registry;

static std::string session_not_found(const std::string &id) {
    return "Session not found: " + id;
}

static std::string session_not_running(const std::string &id) {
    return "Session is not running: " + id;
}

static std::string join_command(const std::vector<std::string> &command) {
    std::string joined;
    for (const auto &argument : command) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += argument;
    }
    return joined;
}

template <typename Result>
static Result failure(ErrorKind kind, const std::string &message) {
    Result result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

// Caller holds registry.mutex.
static SessionRecord *find_record(const std::string &id) {
    auto iterator = registry.sessions.find(id);
    if (iterator == registry.sessions.end()) {
        return nullptr;
    }
    return iterator->second.get();
}

// --- Capture thread ---

static void append_lines(SessionRecord *record, const std::vector<std::string> &lines) {
    if (lines.empty()) {
        return;
    }
    int64_t now = platform::now_epoch_milliseconds();
    std::lock_guard<std::mutex> lock(record->mutex);
    for (const auto &line : lines) {
        if (!session_log_buffer::is_blank(line)) {
            session_log_buffer::append_line(record->logs, line, now);
        }
    }
}

static void close_stream(SessionRecord *record, int &fd, session_log_buffer::LineAssembler &assembler) {
    std::string remainder = session_log_buffer::flush(assembler);
    if (!remainder.empty()) {
        append_lines(record, {remainder});
    }
    platform::close_fd(fd);
}

static void finalize_session(SessionRecord *record, const platform::WaitStatus &exit_status) {
    std::lock_guard<std::mutex> lock(record->mutex);
    platform::close_fd(record->stdin_fd);
    record->finished_at_ms = platform::now_epoch_milliseconds();

    bool clean_exit = exit_status.exited && !exit_status.signaled && exit_status.exit_code == 0;
    if (!session_types::is_finished(record->status)) {
        record->status = (record->stop_requested || clean_exit) ? SessionStatus::Stopped : SessionStatus::Error;
    }

    session_types::LogEntry exit_entry;
    exit_entry.timestamp_ms = record->finished_at_ms;
    if (exit_status.signaled) {
        exit_entry.raw = "Process killed by signal " + std::to_string(exit_status.signal_number);
    } else {
        exit_entry.raw = "Process exited with code " + std::to_string(exit_status.exit_code);
    }
    exit_entry.message = exit_entry.raw;
    exit_entry.level = (record->status == SessionStatus::Error) ? LogLevel::Error : LogLevel::Info;
    session_log_buffer::append_entry(record->logs, std::move(exit_entry));

    debug_log::log("session " + record->id + " finished: status=" +
                   session_types::status_to_string(record->status) + ", " +
                   record->logs.entries.back().message);
}

static void capture_loop(SessionRecord *record) {
    platform::block_shutdown_signals();
    int stdout_fd = record->stdout_fd;
    int stderr_fd = record->stderr_fd;
    session_log_buffer::LineAssembler stdout_lines;
    session_log_buffer::LineAssembler stderr_lines;

    platform::WaitStatus exit_status;
    bool reaped = false;
    bool kill_sent = false;
    auto reaped_at = std::chrono::steady_clock::now();
    char buffer[4096];

    while (true) {
        pollfd poll_fds[2];
        session_log_buffer::LineAssembler *assemblers[2];
        int *stream_fds[2];
        int poll_count = 0;
        if (stdout_fd >= 0) {
            poll_fds[poll_count] = {stdout_fd, POLLIN, 0};
            assemblers[poll_count] = &stdout_lines;
            stream_fds[poll_count++] = &stdout_fd;
        }
        if (stderr_fd >= 0) {
            poll_fds[poll_count] = {stderr_fd, POLLIN, 0};
            assemblers[poll_count] = &stderr_lines;
            stream_fds[poll_count++] = &stderr_fd;
        }

        if (poll_count == 0) {
            if (reaped) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } else {
            int ready = poll(poll_fds, static_cast<nfds_t>(poll_count), kPollTimeoutMilliseconds);
            if (ready < 0 && errno != EINTR) {
                debug_log::warn("session " + record->id + ": poll failed: " + std::string(strerror(errno)));
                close_stream(record, stdout_fd, stdout_lines);
                close_stream(record, stderr_fd, stderr_lines);
            }
            for (int index = 0; index < poll_count && ready > 0; ++index) {
                if ((poll_fds[index].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                ssize_t count = read(poll_fds[index].fd, buffer, sizeof(buffer));
                if (count > 0) {
                    append_lines(record, session_log_buffer::feed(*assemblers[index], buffer,
                                                                  static_cast<size_t>(count)));
                } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
                    close_stream(record, *stream_fds[index], *assemblers[index]);
                }
            }
        }

        if (!reaped) {
            exit_status = platform::try_wait_process(record->process_id);
            if (exit_status.exited) {
                reaped = true;
                reaped_at = std::chrono::steady_clock::now();
                continue;
            }

            bool escalate = false;
            {
                std::lock_guard<std::mutex> lock(record->mutex);
                escalate = record->stop_requested && !kill_sent &&
                           platform::now_epoch_milliseconds() - record->stop_requested_at_ms >=
                               record->kill_grace_milliseconds;
            }
            if (escalate) {
                debug_log::log("session " + record->id + " ignored SIGTERM, sending SIGKILL");
                platform::signal_process_group(record->process_id, SIGKILL);
                kill_sent = true;
            }
        } else {
            auto since_exit = std::chrono::steady_clock::now() - reaped_at;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(since_exit).count() >
                kDrainAfterExitMilliseconds) {
                close_stream(record, stdout_fd, stdout_lines);
                close_stream(record, stderr_fd, stderr_lines);
                break;
            }
        }
    }

    finalize_session(record, exit_status);
}

// Joins and destroys records that are already out of the registry.
static void destroy_records(std::vector<std::unique_ptr<SessionRecord>> &records) {
    for (auto &record : records) {
        if (record->capture_thread.joinable()) {
            record->capture_thread.join();
        }
        debug_log::log("session " + record->id + " removed from registry");
    }
    records.clear();
}

// --- Public functions ---

void configure(const SupervisorSettings &settings) {
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.settings = settings;
}

SupervisorSettings get_settings() {
    std::lock_guard<std::mutex> lock(registry.mutex);
    return registry.settings;
}

SessionResult start_session(const std::string &id, const std::vector<std::string> &command,
                            const StartOptions &options) {
    if (id.empty()) {
        return failure<SessionResult>(ErrorKind::InvalidArgument, "Session id must not be empty");
    }
    if (command.empty() || command[0].empty()) {
        return failure<SessionResult>(ErrorKind::InvalidArgument, "Command must not be empty");
    }

    reap_finished_sessions();

    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    if (find_record(id) != nullptr) {
        debug_log::log("start_session: session already exists: " + id);
        return failure<SessionResult>(ErrorKind::SessionAlreadyExists, "Session already exists: " + id);
    }

    std::string cwd = options.cwd;
    if (cwd.empty()) {
        cwd = registry.settings.default_working_directory;
    }
    if (cwd.empty()) {
        cwd = platform::current_directory();
    }

    debug_log::log("Starting session " + id + ": " + join_command(command) + " (cwd=" + cwd + ")");
    platform::SpawnResult spawn_result = platform::spawn_piped_process(command, cwd);
    if (!spawn_result.success) {
        debug_log::log("start_session " + id + " failed: " + spawn_result.error_message);
        return failure<SessionResult>(ErrorKind::SpawnFailure, spawn_result.error_message);
    }

    auto record = std::make_unique<SessionRecord>();
    record->id = id;
    record->command = command;
    record->cwd = cwd;
    record->start_time_ms = platform::now_epoch_milliseconds();
    record->process_id = spawn_result.process_id;
    record->kill_grace_milliseconds = registry.settings.kill_grace_milliseconds;
    record->stdin_fd = spawn_result.stdin_fd;
    record->stdout_fd = spawn_result.stdout_fd;
    record->stderr_fd = spawn_result.stderr_fd;
    record->logs.capacity = options.log_capacity > 0 ? options.log_capacity
                                                     : registry.settings.default_log_capacity;
    record->metadata = options.metadata;
    // A spawned process is running as far as callers are concerned.
    record->status = SessionStatus::Running;

    SessionRecord *borrowed = record.get();
    try {
        record->capture_thread = std::thread(capture_loop, borrowed);
    } catch (const std::system_error &error) {
        debug_log::warn("start_session " + id + ": could not start capture thread: " + error.what());
        platform::signal_process_group(spawn_result.process_id, SIGKILL);
        platform::close_fd(record->stdin_fd);
        platform::close_fd(record->stdout_fd);
        platform::close_fd(record->stderr_fd);
        while (!platform::try_wait_process(spawn_result.process_id).exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return failure<SessionResult>(ErrorKind::SpawnFailure,
                                      "Failed to start output capture: " + std::string(error.what()));
    }

    registry.sessions.emplace(id, std::move(record));
    debug_log::log("session " + id + " running (pid=" + std::to_string(spawn_result.process_id) + ")");

    SessionResult result;
    result.success = true;
    return result;
}

SessionResult stop_session(const std::string &id) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<SessionResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }

    std::lock_guard<std::mutex> lock(record->mutex);
    SessionResult result;
    result.success = true;
    if (session_types::is_finished(record->status)) {
        return result;
    }

    debug_log::log("Stopping session " + id + " (pid=" + std::to_string(record->process_id) + ")");
    if (!platform::signal_process_group(record->process_id, SIGTERM)) {
        debug_log::log("stop_session " + id + ": SIGTERM not delivered, process already gone");
    }
    record->stop_requested = true;
    record->stop_requested_at_ms = platform::now_epoch_milliseconds();
    record->status = SessionStatus::Stopped;
    return result;
}

SessionResult send_input(const std::string &id, const std::string &text) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<SessionResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }

    std::lock_guard<std::mutex> lock(record->mutex);
    if (record->status != SessionStatus::Running) {
        return failure<SessionResult>(ErrorKind::SessionNotRunning, session_not_running(id));
    }

    std::string write_error;
    if (!platform::write_all(record->stdin_fd, text + "\n", write_error)) {
        debug_log::log("send_input " + id + " failed: " + write_error);
        return failure<SessionResult>(ErrorKind::ReadFailure,
                                      "Failed to write to session " + id + ": " + write_error);
    }

    debug_log::log("Sent input to session " + id + ": " + text.substr(0, kInputLogPreviewLength));
    SessionResult result;
    result.success = true;
    return result;
}

ReadOutputResult read_output(const std::string &id, std::size_t tail) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<ReadOutputResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }

    std::lock_guard<std::mutex> lock(record->mutex);
    ReadOutputResult result;
    result.success = true;
    result.logs = session_log_buffer::tail_entries(record->logs, tail);
    result.status = record->status;
    result.total_captured = record->logs.total_appended;
    return result;
}

StatusResult get_status(const std::string &id) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<StatusResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }

    std::lock_guard<std::mutex> lock(record->mutex);
    StatusResult result;
    result.success = true;
    result.status = record->status;
    result.uptime_ms = platform::now_epoch_milliseconds() - record->start_time_ms;
    result.log_count = record->logs.entries.size();
    return result;
}

std::vector<SessionInfo> list_sessions() {
    std::vector<SessionInfo> sessions;
    int64_t now = platform::now_epoch_milliseconds();

    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    for (const auto &entry : registry.sessions) {
        SessionRecord *record = entry.second.get();
        std::lock_guard<std::mutex> lock(record->mutex);
        SessionInfo info;
        info.id = record->id;
        info.status = record->status;
        info.start_time_ms = record->start_time_ms;
        info.uptime_ms = now - record->start_time_ms;
        info.log_count = record->logs.entries.size();
        info.command = record->command;
        info.cwd = record->cwd;
        sessions.push_back(std::move(info));
    }
    return sessions;
}

SessionResult remove_session(const std::string &id) {
    std::vector<std::unique_ptr<SessionRecord>> removed;
    {
        std::lock_guard<std::mutex> registry_lock(registry.mutex);
        auto iterator = registry.sessions.find(id);
        if (iterator == registry.sessions.end()) {
            return failure<SessionResult>(ErrorKind::SessionNotFound, session_not_found(id));
        }
        {
            std::lock_guard<std::mutex> lock(iterator->second->mutex);
            if (iterator->second->finished_at_ms == 0) {
                return failure<SessionResult>(ErrorKind::InvalidArgument,
                                              "Session is still active: " + id + " (stop it first)");
            }
        }
        removed.push_back(std::move(iterator->second));
        registry.sessions.erase(iterator);
    }
    destroy_records(removed);

    SessionResult result;
    result.success = true;
    return result;
}

std::size_t reap_finished_sessions() {
    std::vector<std::unique_ptr<SessionRecord>> expired;
    {
        std::lock_guard<std::mutex> registry_lock(registry.mutex);
        int64_t now = platform::now_epoch_milliseconds();
        int64_t retention = registry.settings.session_retention_milliseconds;
        for (auto iterator = registry.sessions.begin(); iterator != registry.sessions.end();) {
            bool is_expired = false;
            {
                std::lock_guard<std::mutex> lock(iterator->second->mutex);
                is_expired = iterator->second->finished_at_ms > 0 &&
                             now - iterator->second->finished_at_ms > retention;
            }
            if (is_expired) {
                expired.push_back(std::move(iterator->second));
                iterator = registry.sessions.erase(iterator);
            } else {
                ++iterator;
            }
        }
    }

    std::size_t count = expired.size();
    if (count > 0) {
        debug_log::log("Reaping " + std::to_string(count) + " finished session(s)");
    }
    destroy_records(expired);
    return count;
}

SessionResult set_metadata(const std::string &id, const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<SessionResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    record->metadata[key] = value;
    SessionResult result;
    result.success = true;
    return result;
}

MetadataResult get_metadata(const std::string &id, const std::string &key) {
    std::lock_guard<std::mutex> registry_lock(registry.mutex);
    SessionRecord *record = find_record(id);
    if (record == nullptr) {
        return failure<MetadataResult>(ErrorKind::SessionNotFound, session_not_found(id));
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    MetadataResult result;
    result.success = true;
    auto iterator = record->metadata.find(key);
    if (iterator != record->metadata.end()) {
        result.value = iterator->second;
    }
    return result;
}

void stop_all_sessions() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> registry_lock(registry.mutex);
        for (const auto &entry : registry.sessions) {
            ids.push_back(entry.first);
        }
    }
    for (const auto &id : ids) {
        stop_session(id);
    }
}

void shutdown() {
    stop_all_sessions();

    std::vector<std::unique_ptr<SessionRecord>> all_records;
    {
        std::lock_guard<std::mutex> registry_lock(registry.mutex);
        for (auto &entry : registry.sessions) {
            all_records.push_back(std::move(entry.second));
        }
        registry.sessions.clear();
    }
    debug_log::log("shutdown: waiting for " + std::to_string(all_records.size()) + " capture thread(s)");
    destroy_records(all_records);
}

} // namespace session_supervisor
