#ifndef RNMCPS_PLATFORM_ABI_HPP
#define RNMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with piped stdio.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;   // write end, non-blocking
    int stdout_fd = -1;  // read end
    int stderr_fd = -1;  // read end
    std::string error_message;
};

// Spawn argv[0] (looked up on PATH when it has no slash) with argv as its
// argument vector. No shell is involved. The child becomes the leader of a
// new process group, starts in working_directory (empty = inherit), and has
// default dispositions for SIGPIPE, SIGINT and SIGTERM.
SpawnResult spawn_piped_process(const std::vector<std::string> &argv,
                                const std::string &working_directory);

// Outcome of a non-blocking wait.
struct WaitStatus {
    bool exited = false;      // true once the child has been reaped
    bool signaled = false;    // terminated by a signal
    int exit_code = -1;       // valid when exited && !signaled
    int signal_number = 0;    // valid when signaled
    std::string error_message;
};

// Reap the child if it has terminated. Never blocks.
WaitStatus try_wait_process(int process_id);

// Send a signal to the child's whole process group (falls back to the child
// itself if the group is gone). Returns false if nothing could be signaled.
bool signal_process_group(int process_id, int signal_number);

// Write all of data to a non-blocking fd. Fails instead of blocking when the
// pipe is full, and reports EPIPE when the reader is gone.
bool write_all(int fd, const std::string &data, std::string &error_message);

// Close an fd if it is open and reset it to -1.
void close_fd(int &fd);

// Result of running a short-lived helper process to completion.
struct RunResult {
    bool success = false;      // spawned, exited with code 0, within timeout
    int exit_code = -1;
    std::string standard_output;
    std::string standard_error;
    std::string error_message;
};

// Run argv to completion, capturing stdout and stderr. The child is killed if
// it runs longer than timeout_milliseconds.
RunResult run_process(const std::vector<std::string> &argv, int timeout_milliseconds);

// Search PATH for an executable. Returns the full path or empty string.
// Names containing a slash are returned unchanged if they exist.
std::string find_executable(const std::string &name);

// Directory check used before spawning.
bool is_directory(const std::string &path);

// The server's current working directory.
std::string current_directory();

// Wall-clock time in milliseconds since the epoch.
int64_t now_epoch_milliseconds();

// Ignore SIGPIPE for the server process so writes to a dead child's stdin
// report EPIPE instead of terminating us.
void ignore_broken_pipe_signal();

// Block SIGINT and SIGTERM in the calling thread, so that worker threads never
// take a shutdown signal meant to interrupt the main thread.
void block_shutdown_signals();

} // namespace platform

#endif // RNMCPS_PLATFORM_ABI_HPP
