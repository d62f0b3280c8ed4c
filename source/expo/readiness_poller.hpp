#ifndef RNMCPS_READINESS_POLLER_HPP
#define RNMCPS_READINESS_POLLER_HPP

// Dev-server start workflow: start a session, then poll its output until the
// server reports it is ready, the process fails, the time budget runs out or
// the caller cancels. Every failure after a successful start stops the session.

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "expo/qr_generator.hpp"
#include "session/session_supervisor.hpp"

namespace readiness_poller {

using session_types::ErrorKind;

enum class PollerState {
    Spawning,
    WaitingForReady,
    Ready,
    TimedOut,
    Errored
};

std::string state_to_string(PollerState state);

// Cancellation shared between the polling thread and any other thread.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const;

    // Sleep up to duration; returns true early if cancelled.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
    bool cancelled_ = false;
};

// Cancelled once the server begins shutting down. Blocking tool calls wait on
// it so a signal does not have to outlast their timeout.
CancellationToken &shutdown_token();

// Cancels token once flag becomes non-zero. A signal handler may only set a
// sig_atomic_t; this thread turns that flag into a condition-variable wakeup.
class SignalFlagWatcher {
public:
    SignalFlagWatcher(const volatile sig_atomic_t &flag, CancellationToken &token,
                      int poll_interval_milliseconds = 100);
    ~SignalFlagWatcher();

    SignalFlagWatcher(const SignalFlagWatcher &) = delete;
    SignalFlagWatcher &operator=(const SignalFlagWatcher &) = delete;

private:
    void run();

    const volatile sig_atomic_t &flag_;
    CancellationToken &token_;
    std::chrono::milliseconds poll_interval_;
    CancellationToken stop_;
    std::thread thread_;
};

// (url, format) -> rendered QR. Replaceable so tests need no external tool.
using QrCollaborator = std::function<qr_generator::QrResult(const std::string &, qr_generator::QrFormat)>;

struct ReadinessOptions {
    int timeout_milliseconds = 60000;
    int poll_interval_milliseconds = 1000;
    qr_generator::QrFormat qr_format = qr_generator::QrFormat::Terminal;
    std::string platform = "all";
    const CancellationToken *cancellation = nullptr; // optional
    QrCollaborator qr_collaborator;                  // empty = qr_generator::generate
};

struct DevServerResult {
    std::string session_id;
    std::string qr_code;
    std::string url;
    std::string status;
    std::string platform;
    std::optional<int> port;
};

struct ReadinessResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    PollerState final_state = PollerState::Spawning;
    DevServerResult data; // valid when success
};

// Entries fetched per poll.
constexpr std::size_t kPollTailEntries = 100;

ReadinessResult start_and_wait(const std::string &session_id, const std::vector<std::string> &command,
                               const session_supervisor::StartOptions &start_options,
                               const ReadinessOptions &options);

// The dev-server URL in lines; the earliest line with one wins.
std::optional<std::string> find_dev_server_url(const std::vector<std::string> &lines);

} // namespace readiness_poller

#endif // RNMCPS_READINESS_POLLER_HPP
