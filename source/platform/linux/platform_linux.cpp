#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <poll.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

static std::string errno_text(int error_number) {
    return std::string(strerror(error_number));
}

// Owns the three pipe pairs until they are handed to the caller.
struct PipeSet {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    ~PipeSet() {
        for (int *pair : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(pair[0]);
            close_fd(pair[1]);
        }
    }
};

SpawnResult spawn_piped_process(const std::vector<std::string> &argv,
                                const std::string &working_directory) {
    SpawnResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error_message = "Command must not be empty";
        return result;
    }

    if (!working_directory.empty() && !is_directory(working_directory)) {
        result.error_message = "Working directory does not exist: " + working_directory;
        return result;
    }

    PipeSet pipes;
    if (pipe2(pipes.stdin_pipe, O_CLOEXEC) != 0 ||
        pipe2(pipes.stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(pipes.stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe2 failed: " + errno_text(errno);
        return result;
    }

    // Build argv array: [arg0, arg1, ..., nullptr]
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings = argv;
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, pipes.stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, pipes.stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, pipes.stderr_pipe[1], STDERR_FILENO);
    if (!working_directory.empty()) {
        posix_spawn_file_actions_addchdir_np(&file_actions, working_directory.c_str());
    }

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF |
                                              POSIX_SPAWN_SETSIGMASK);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, argv_strings[0].c_str(),
                                    &file_actions, &attributes,
                                    argv_pointers.data(), environ);

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);

    if (spawn_status != 0) {
        result.error_message = "Failed to spawn '" + argv[0] + "': " + errno_text(spawn_status);
        return result;
    }

    // Parent keeps the write end of stdin and the read ends of stdout/stderr.
    int flags = fcntl(pipes.stdin_pipe[1], F_GETFL);
    if (flags >= 0) {
        fcntl(pipes.stdin_pipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = pipes.stdin_pipe[1];
    result.stdout_fd = pipes.stdout_pipe[0];
    result.stderr_fd = pipes.stderr_pipe[0];
    pipes.stdin_pipe[1] = -1;
    pipes.stdout_pipe[0] = -1;
    pipes.stderr_pipe[0] = -1;
    return result;
}

WaitStatus try_wait_process(int process_id) {
    WaitStatus status;
    if (process_id <= 0) {
        status.error_message = "invalid process id";
        return status;
    }

    int raw_status = 0;
    pid_t waited = waitpid(static_cast<pid_t>(process_id), &raw_status, WNOHANG);
    if (waited == 0) {
        return status;
    }
    if (waited < 0) {
        // ECHILD: someone else reaped it; treat as exited with unknown code.
        int wait_error = errno;
        status.error_message = "waitpid failed: " + errno_text(wait_error);
        status.exited = (wait_error == ECHILD);
        return status;
    }

    status.exited = true;
    if (WIFEXITED(raw_status)) {
        status.exit_code = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        status.signaled = true;
        status.signal_number = WTERMSIG(raw_status);
    }
    return status;
}

bool signal_process_group(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(-static_cast<pid_t>(process_id), signal_number) == 0) {
        return true;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

bool write_all(int fd, const std::string &data, std::string &error_message) {
    if (fd < 0) {
        error_message = "input channel is closed";
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(fd, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            error_message = "input channel is full (process is not reading stdin)";
            return false;
        }
        error_message = "write failed: " + errno_text(errno);
        return false;
    }
    return true;
}

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

RunResult run_process(const std::vector<std::string> &argv, int timeout_milliseconds) {
    RunResult result;

    SpawnResult spawn_result = spawn_piped_process(argv, "");
    if (!spawn_result.success) {
        result.error_message = spawn_result.error_message;
        return result;
    }
    close_fd(spawn_result.stdin_fd);

    int stdout_fd = spawn_result.stdout_fd;
    int stderr_fd = spawn_result.stderr_fd;
    auto start_time = std::chrono::steady_clock::now();
    bool timed_out = false;
    char buffer[4096];

    while (stdout_fd >= 0 || stderr_fd >= 0) {
        pollfd poll_fds[2];
        int poll_count = 0;
        if (stdout_fd >= 0) {
            poll_fds[poll_count++] = {stdout_fd, POLLIN, 0};
        }
        if (stderr_fd >= 0) {
            poll_fds[poll_count++] = {stderr_fd, POLLIN, 0};
        }

        int ready = poll(poll_fds, static_cast<nfds_t>(poll_count), 50);
        if (ready < 0 && errno != EINTR) {
            result.error_message = "poll failed: " + errno_text(errno);
            break;
        }

        for (int index = 0; index < poll_count && ready > 0; ++index) {
            if ((poll_fds[index].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t count = read(poll_fds[index].fd, buffer, sizeof(buffer));
            bool is_stdout = (poll_fds[index].fd == stdout_fd);
            if (count > 0) {
                (is_stdout ? result.standard_output : result.standard_error)
                    .append(buffer, static_cast<size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                close_fd(is_stdout ? stdout_fd : stderr_fd);
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            timed_out = true;
            signal_process_group(spawn_result.process_id, SIGKILL);
            break;
        }
    }
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    int raw_status = 0;
    while (waitpid(static_cast<pid_t>(spawn_result.process_id), &raw_status, 0) < 0 && errno == EINTR) {
    }

    if (timed_out) {
        result.error_message = "'" + argv[0] + "' timed out after " +
                               std::to_string(timeout_milliseconds) + "ms";
        return result;
    }
    if (WIFEXITED(raw_status)) {
        result.exit_code = WEXITSTATUS(raw_status);
    }
    if (result.exit_code != 0) {
        if (result.error_message.empty()) {
            result.error_message = "'" + argv[0] + "' exited with code " + std::to_string(result.exit_code);
        }
        return result;
    }

    result.success = result.error_message.empty();
    return result;
}

std::string find_executable(const std::string &name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return (access(name.c_str(), X_OK) == 0) ? name : "";
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

bool is_directory(const std::string &path) {
    std::error_code error;
    return std::filesystem::is_directory(path, error);
}

std::string current_directory() {
    std::error_code error;
    std::filesystem::path path = std::filesystem::current_path(error);
    if (error) {
        return ".";
    }
    return path.string();
}

int64_t now_epoch_milliseconds() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

void ignore_broken_pipe_signal() {
    std::signal(SIGPIPE, SIG_IGN);
}

void block_shutdown_signals() {
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
}

} // namespace platform
