#include "expo/readiness_poller.hpp"
#include "logs/log_classifier.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

#include <thread>

namespace readiness_poller {

std::string state_to_string(PollerState state) {
    switch (state) {
    case PollerState::Spawning:
        return "spawning";
    case PollerState::WaitingForReady:
        return "waiting_for_ready";
    case PollerState::Ready:
        return "ready";
    case PollerState::TimedOut:
        return "timed_out";
    case PollerState::Errored:
        return "errored";
    }
    return "errored";
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, duration, [this] { return cancelled_; });
}

CancellationToken &shutdown_token() {
    static CancellationToken token;
    return token;
}

SignalFlagWatcher::SignalFlagWatcher(const volatile sig_atomic_t &flag, CancellationToken &token,
                                     int poll_interval_milliseconds)
    : flag_(flag), token_(token), poll_interval_(poll_interval_milliseconds) {
    thread_ = std::thread(&SignalFlagWatcher::run, this);
}

SignalFlagWatcher::~SignalFlagWatcher() {
    stop_.cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalFlagWatcher::run() {
    // Leave SIGINT/SIGTERM to the main thread so they interrupt its stdin read.
    platform::block_shutdown_signals();
    while (!stop_.is_cancelled()) {
        if (flag_ != 0) {
            debug_log::log("Shutdown requested; cancelling pending waits.");
            token_.cancel();
            return;
        }
        stop_.wait_for(poll_interval_);
    }
}

std::optional<std::string> find_dev_server_url(const std::vector<std::string> &lines) {
    for (const auto &line : lines) {
        auto url = log_classifier::extract_url(line);
        if (url) {
            return url;
        }
    }
    return std::nullopt;
}

// Stop the session and report the failure.
static ReadinessResult fail_and_stop(const std::string &session_id, PollerState state, ErrorKind kind,
                                     const std::string &message) {
    session_supervisor::SessionResult stop_result = session_supervisor::stop_session(session_id);
    if (!stop_result.success) {
        debug_log::log("readiness: could not stop " + session_id + ": " + stop_result.error_message);
    }
    debug_log::log("readiness: " + session_id + " " + state_to_string(state) + ": " + message);

    ReadinessResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    result.final_state = state;
    return result;
}

static std::string render_qr_code(const std::string &url, const ReadinessOptions &options) {
    qr_generator::QrResult qr_result;
    if (options.qr_collaborator) {
        qr_result = options.qr_collaborator(url, options.qr_format);
    } else {
        qr_result = qr_generator::generate(url, options.qr_format,
                                           server_config::current().qrencode_executable);
    }
    if (!qr_result.success) {
        debug_log::warn("Failed to generate QR code, using URL instead: " + qr_result.error_message);
        return url;
    }
    return qr_generator::format_output(qr_result);
}

ReadinessResult start_and_wait(const std::string &session_id, const std::vector<std::string> &command,
                               const session_supervisor::StartOptions &start_options,
                               const ReadinessOptions &options) {
    ReadinessResult result;
    result.final_state = PollerState::Spawning;

    session_supervisor::SessionResult start_result =
        session_supervisor::start_session(session_id, command, start_options);
    if (!start_result.success) {
        result.error_kind = start_result.error_kind;
        result.error_message = start_result.error_message.empty() ? "Failed to start session"
                                                                  : start_result.error_message;
        result.final_state = PollerState::Errored;
        return result;
    }

    debug_log::log("Dev server session " + session_id + " started, waiting for server to be ready");
    result.final_state = PollerState::WaitingForReady;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.timeout_milliseconds);
    auto interval = std::chrono::milliseconds(options.poll_interval_milliseconds > 0
                                                  ? options.poll_interval_milliseconds : 1);

    while (std::chrono::steady_clock::now() < deadline) {
        if (options.cancellation && options.cancellation->is_cancelled()) {
            return fail_and_stop(session_id, PollerState::Errored, ErrorKind::Cancelled,
                                 "Dev server start cancelled");
        }

        session_supervisor::StatusResult status = session_supervisor::get_status(session_id);
        if (!status.success) {
            return fail_and_stop(session_id, PollerState::Errored, status.error_kind, status.error_message);
        }
        // The process died on its own; treat it like a failed spawn.
        if (status.status == session_types::SessionStatus::Error) {
            return fail_and_stop(session_id, PollerState::Errored, ErrorKind::SpawnFailure,
                                 "Dev server encountered an error");
        }

        session_supervisor::ReadOutputResult output = session_supervisor::read_output(session_id, kPollTailEntries);
        if (!output.success) {
            return fail_and_stop(session_id, PollerState::Errored, ErrorKind::ReadFailure,
                                 output.error_message.empty() ? "Failed to read session logs"
                                                              : output.error_message);
        }

        std::vector<std::string> messages;
        messages.reserve(output.logs.size());
        for (const auto &entry : output.logs) {
            messages.push_back(entry.message);
        }

        if (log_classifier::is_dev_server_ready(messages)) {
            std::optional<std::string> url = find_dev_server_url(messages);
            if (!url) {
                return fail_and_stop(session_id, PollerState::Errored, ErrorKind::SignalNotFound,
                                     "Dev server started but URL not found in logs");
            }

            result.success = true;
            result.final_state = PollerState::Ready;
            result.data.session_id = session_id;
            result.data.url = *url;
            result.data.qr_code = render_qr_code(*url, options);
            result.data.status = "running";
            result.data.platform = options.platform;
            result.data.port = log_classifier::extract_port(*url);

            session_supervisor::set_metadata(session_id, "url", *url);
            if (result.data.port) {
                session_supervisor::set_metadata(session_id, "port", std::to_string(*result.data.port));
            }
            debug_log::log("Dev server ready: " + session_id + " at " + *url);
            return result;
        }

        if (status.status == session_types::SessionStatus::Stopped) {
            return fail_and_stop(session_id, PollerState::Errored, ErrorKind::SpawnFailure,
                                 "Dev server exited before it was ready");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto sleep_for = remaining < interval ? remaining : interval;
        if (sleep_for.count() <= 0) {
            break;
        }
        if (options.cancellation) {
            options.cancellation->wait_for(sleep_for);
        } else {
            std::this_thread::sleep_for(sleep_for);
        }
    }

    if (options.cancellation && options.cancellation->is_cancelled()) {
        return fail_and_stop(session_id, PollerState::Errored, ErrorKind::Cancelled, "Dev server start cancelled");
    }
    return fail_and_stop(session_id, PollerState::TimedOut, ErrorKind::ReadinessTimeout,
                         "Command timed out after " + std::to_string(options.timeout_milliseconds) + "ms");
}

} // namespace readiness_poller
