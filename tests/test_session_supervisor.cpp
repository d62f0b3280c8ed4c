// Tests for the session supervisor, using real child processes (/bin/sh,
// seq, cat, sleep). Each test uses its own session ids because the registry
// is process-wide.

#include "session/session_supervisor.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace test_session_supervisor {

using session_types::ErrorKind;
using session_types::SessionStatus;
using test_support::shell;

// Test: 1000 lines into a 100-entry session; the last 100 come back in order.
static bool test_capacity_keeps_latest_lines() {
    const std::string id = "supervisor-capacity";
    session_supervisor::StartOptions options;
    options.log_capacity = 100;
    auto start = session_supervisor::start_session(id, shell("seq 1 1000; exec sleep 30"), options);
    if (!start.success) {
        std::cout << "  FAIL: start_session failed: " << start.error_message << std::endl;
        return false;
    }

    bool captured = test_support::wait_until([&id] {
        return session_supervisor::read_output(id, 1).total_captured >= 1000;
    });
    auto output = session_supervisor::read_output(id, 100);

    bool success = captured && output.success && output.logs.size() == 100 &&
                   output.total_captured == 1000 && output.status == SessionStatus::Running;
    for (std::size_t index = 0; success && index < output.logs.size(); ++index) {
        success = output.logs[index].message == std::to_string(901 + index);
    }
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: read_output(100) returns lines 901..1000 in order" << std::endl;
    } else {
        std::cout << "  FAIL: Captured " << output.total_captured << ", returned " << output.logs.size() << std::endl;
    }
    return success;
}

// Test: Every operation on an unknown id fails with SessionNotFound.
static bool test_unknown_session_id() {
    const std::string id = "supervisor-does-not-exist";
    auto stop = session_supervisor::stop_session(id);
    auto send = session_supervisor::send_input(id, "r");
    auto read = session_supervisor::read_output(id, 10);
    auto status = session_supervisor::get_status(id);
    auto remove = session_supervisor::remove_session(id);
    std::string expected = "Session not found: " + id;

    bool success = !stop.success && stop.error_kind == ErrorKind::SessionNotFound && stop.error_message == expected &&
                   !send.success && send.error_kind == ErrorKind::SessionNotFound &&
                   !read.success && read.error_kind == ErrorKind::SessionNotFound &&
                   !status.success && status.error_kind == ErrorKind::SessionNotFound &&
                   !remove.success && remove.error_kind == ErrorKind::SessionNotFound;

    if (success) {
        std::cout << "  OK: Unknown session id reported as not found by every operation" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown session id handling mismatch" << std::endl;
    }
    return success;
}

// Test: send_input writes to stdin and does not add a log line by itself.
static bool test_send_input_does_not_log() {
    const std::string id = "supervisor-send-silent";
    auto start = session_supervisor::start_session(id, {"sleep", "30"});
    if (!start.success) {
        std::cout << "  FAIL: start_session failed: " << start.error_message << std::endl;
        return false;
    }

    auto before = session_supervisor::read_output(id, 0);
    auto send = session_supervisor::send_input(id, "r");
    auto after = session_supervisor::read_output(id, 0);

    bool success = send.success && before.logs.size() == after.logs.size() && after.total_captured == 0;
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: send_input leaves the output buffer unchanged" << std::endl;
    } else {
        std::cout << "  FAIL: send_input changed the log (" << before.logs.size() << " -> "
                  << after.logs.size() << ") or failed: " << send.error_message << std::endl;
    }
    return success;
}

// Test: Input reaches the child; an echoing child shows it in the output.
static bool test_send_input_reaches_child() {
    const std::string id = "supervisor-send-echo";
    auto start = session_supervisor::start_session(id, {"cat"});
    if (!start.success) {
        std::cout << "  FAIL: start_session failed: " << start.error_message << std::endl;
        return false;
    }

    auto send = session_supervisor::send_input(id, "hello from stdin");
    bool echoed = test_support::wait_until([&id] {
        auto output = session_supervisor::read_output(id, 0);
        return !output.logs.empty() && output.logs.front().message == "hello from stdin";
    });
    test_support::discard_session(id);

    bool success = send.success && echoed;
    if (success) {
        std::cout << "  OK: Input line echoed back by cat" << std::endl;
    } else {
        std::cout << "  FAIL: Input was not echoed" << std::endl;
    }
    return success;
}

// Test: A second start under a live id is rejected and creates nothing.
static bool test_duplicate_session_id() {
    const std::string id = "supervisor-duplicate";
    auto first = session_supervisor::start_session(id, {"sleep", "30"});
    auto second = session_supervisor::start_session(id, {"sleep", "30"});
    auto status = session_supervisor::get_status(id);

    bool success = first.success && !second.success && second.error_kind == ErrorKind::SessionAlreadyExists &&
                   second.error_message == "Session already exists: " + id &&
                   status.success && status.status == SessionStatus::Running;
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: Duplicate session id rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Duplicate session id handling mismatch: " << second.error_message << std::endl;
    }
    return success;
}

// Test: Spawn failures are returned as data and register nothing.
static bool test_spawn_failures() {
    auto missing_binary = session_supervisor::start_session("supervisor-missing", {"/nonexistent/tool-xyz"});
    session_supervisor::StartOptions bad_cwd;
    bad_cwd.cwd = "/nonexistent/directory-xyz";
    auto missing_cwd = session_supervisor::start_session("supervisor-bad-cwd", {"sleep", "1"}, bad_cwd);
    auto empty_command = session_supervisor::start_session("supervisor-empty", {});
    auto status = session_supervisor::get_status("supervisor-missing");

    bool success = !missing_binary.success && missing_binary.error_kind == ErrorKind::SpawnFailure &&
                   !missing_binary.error_message.empty() &&
                   !missing_cwd.success && missing_cwd.error_kind == ErrorKind::SpawnFailure &&
                   missing_cwd.error_message.find("Working directory does not exist") != std::string::npos &&
                   !empty_command.success && !empty_command.error_message.empty() &&
                   !status.success;

    if (success) {
        std::cout << "  OK: Spawn failures reported without registering a session" << std::endl;
    } else {
        std::cout << "  FAIL: Spawn failure handling mismatch: " << missing_binary.error_message << std::endl;
    }
    return success;
}

// Test: stop is immediate, idempotent, and blocks further input.
static bool test_stop_session() {
    const std::string id = "supervisor-stop";
    auto start = session_supervisor::start_session(id, {"sleep", "30"});
    auto first_stop = session_supervisor::stop_session(id);
    auto status = session_supervisor::get_status(id);
    auto second_stop = session_supervisor::stop_session(id);
    auto send = session_supervisor::send_input(id, "r");
    bool exited = test_support::wait_for_exit(id);
    auto output = session_supervisor::read_output(id, 1);

    bool success = start.success && first_stop.success && second_stop.success &&
                   status.status == SessionStatus::Stopped &&
                   !send.success && send.error_kind == ErrorKind::SessionNotRunning &&
                   exited && output.status == SessionStatus::Stopped &&
                   output.logs.back().message == "Process killed by signal 15";
    session_supervisor::remove_session(id);

    if (success) {
        std::cout << "  OK: stop_session is immediate and idempotent" << std::endl;
    } else {
        std::cout << "  FAIL: stop_session mismatch" << std::endl;
    }
    return success;
}

// Test: Exit codes map to stopped (0) and error (non-zero).
static bool test_exit_status_mapping() {
    auto clean = session_supervisor::start_session("supervisor-exit-clean", shell("echo done"));
    auto failing = session_supervisor::start_session("supervisor-exit-fail", shell("echo broken >&2; exit 3"));

    bool clean_exited = test_support::wait_for_exit("supervisor-exit-clean");
    bool failing_exited = test_support::wait_for_exit("supervisor-exit-fail");
    auto clean_output = session_supervisor::read_output("supervisor-exit-clean", 0);
    auto failing_output = session_supervisor::read_output("supervisor-exit-fail", 0);

    bool success = clean.success && failing.success && clean_exited && failing_exited &&
                   clean_output.status == SessionStatus::Stopped &&
                   clean_output.logs.size() == 2 && clean_output.logs[0].message == "done" &&
                   clean_output.logs[1].message == "Process exited with code 0" &&
                   failing_output.status == SessionStatus::Error &&
                   failing_output.logs.size() == 2 && failing_output.logs[0].message == "broken" &&
                   failing_output.logs[1].level == session_types::LogLevel::Error &&
                   failing_output.logs[1].message == "Process exited with code 3";
    session_supervisor::remove_session("supervisor-exit-clean");
    session_supervisor::remove_session("supervisor-exit-fail");

    if (success) {
        std::cout << "  OK: Exit code 0 -> stopped, exit code 3 -> error" << std::endl;
    } else {
        std::cout << "  FAIL: Exit status mapping mismatch" << std::endl;
    }
    return success;
}

// Test: A process that ignores SIGTERM is killed after the grace period.
static bool test_kill_escalation() {
    session_supervisor::SupervisorSettings saved = session_supervisor::get_settings();
    session_supervisor::SupervisorSettings quick = saved;
    quick.kill_grace_milliseconds = 200;
    session_supervisor::configure(quick);

    const std::string id = "supervisor-stubborn";
    auto start = session_supervisor::start_session(id, shell("trap '' TERM; echo armed; sleep 30"));
    bool armed = test_support::wait_until([&id] { return session_supervisor::read_output(id, 0).total_captured > 0; });
    auto stop = session_supervisor::stop_session(id);
    bool exited = test_support::wait_for_exit(id, 5000);
    auto output = session_supervisor::read_output(id, 1);
    session_supervisor::configure(saved);

    bool success = start.success && armed && stop.success && exited &&
                   output.logs.back().message == "Process killed by signal 9";
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: SIGKILL sent after the grace period" << std::endl;
    } else {
        std::cout << "  FAIL: Stubborn process not killed" << std::endl;
    }
    return success;
}

// Test: Live sessions cannot be removed; finished ones can.
static bool test_remove_session() {
    const std::string id = "supervisor-remove";
    auto start = session_supervisor::start_session(id, {"sleep", "30"});
    auto live_remove = session_supervisor::remove_session(id);
    session_supervisor::stop_session(id);
    bool exited = test_support::wait_for_exit(id);
    auto finished_remove = session_supervisor::remove_session(id);
    auto status = session_supervisor::get_status(id);

    bool success = start.success && !live_remove.success && exited && finished_remove.success &&
                   !status.success && status.error_kind == ErrorKind::SessionNotFound;

    if (success) {
        std::cout << "  OK: remove_session refuses live sessions, removes finished ones" << std::endl;
    } else {
        std::cout << "  FAIL: remove_session mismatch: " << finished_remove.error_message << std::endl;
    }
    return success;
}

// Test: Finished sessions past the retention window are reaped.
static bool test_reap_finished_sessions() {
    session_supervisor::SupervisorSettings saved = session_supervisor::get_settings();
    session_supervisor::SupervisorSettings short_retention = saved;
    short_retention.session_retention_milliseconds = 1;
    session_supervisor::configure(short_retention);

    const std::string finished_id = "supervisor-reap-finished";
    const std::string live_id = "supervisor-reap-live";
    // Start the live one first: every start reaps, and the finished one must
    // still be registered when it is checked below.
    auto live = session_supervisor::start_session(live_id, {"sleep", "30"});
    auto finished = session_supervisor::start_session(finished_id, {"true"});
    bool exited = test_support::wait_for_exit(finished_id);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::size_t reaped = session_supervisor::reap_finished_sessions();
    auto finished_status = session_supervisor::get_status(finished_id);
    auto live_status = session_supervisor::get_status(live_id);
    session_supervisor::configure(saved);

    bool success = finished.success && live.success && exited && reaped >= 1 &&
                   !finished_status.success && live_status.success;
    test_support::discard_session(live_id);

    if (success) {
        std::cout << "  OK: Expired finished sessions reaped, live session kept" << std::endl;
    } else {
        std::cout << "  FAIL: Reaping mismatch (reaped " << reaped << ")" << std::endl;
    }
    return success;
}

// Test: Status, listing and metadata.
static bool test_status_list_and_metadata() {
    const std::string id = "supervisor-list";
    session_supervisor::StartOptions options;
    options.cwd = "/tmp";
    options.metadata["kind"] = "dev";
    auto start = session_supervisor::start_session(id, shell("echo one; echo two; exec sleep 30"), options);
    test_support::wait_until([&id] { return session_supervisor::read_output(id, 0).total_captured >= 2; });

    auto status = session_supervisor::get_status(id);
    auto set = session_supervisor::set_metadata(id, "port", "8081");
    auto port = session_supervisor::get_metadata(id, "port");
    auto kind = session_supervisor::get_metadata(id, "kind");
    auto missing = session_supervisor::get_metadata(id, "url");

    bool listed = false;
    for (const auto &info : session_supervisor::list_sessions()) {
        if (info.id == id) {
            listed = info.status == SessionStatus::Running && info.cwd == "/tmp" &&
                     info.command.size() == 3 && info.command[0] == "/bin/sh" && info.log_count == 2;
        }
    }

    bool success = start.success && status.success && status.status == SessionStatus::Running &&
                   status.log_count == 2 && status.uptime_ms >= 0 && listed &&
                   set.success && port.value && *port.value == "8081" &&
                   kind.value && *kind.value == "dev" && missing.success && !missing.value;
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: Status, list and metadata reflect the session" << std::endl;
    } else {
        std::cout << "  FAIL: Status/list/metadata mismatch" << std::endl;
    }
    return success;
}

// Test: Progress output redrawn with '\r' becomes separate entries.
static bool test_carriage_return_progress() {
    const std::string id = "supervisor-progress";
    auto start = session_supervisor::start_session(
        id, shell("printf 'Bundling 10.0%%\\rBundling 55.5%%\\r\\n\\nready\\n'; exec sleep 30"));
    bool captured = test_support::wait_until([&id] {
        return session_supervisor::read_output(id, 0).total_captured >= 3;
    });
    auto output = session_supervisor::read_output(id, 0);

    bool success = start.success && captured && output.logs.size() == 3 &&
                   output.logs[0].message == "Bundling 10.0%" &&
                   output.logs[1].message == "Bundling 55.5%" &&
                   output.logs[2].message == "ready";
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: CR-separated progress split into entries, blank lines dropped" << std::endl;
    } else {
        std::cout << "  FAIL: Captured " << output.logs.size() << " entries" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_capacity_keeps_latest_lines();
    all_passed &= test_unknown_session_id();
    all_passed &= test_send_input_does_not_log();
    all_passed &= test_send_input_reaches_child();
    all_passed &= test_duplicate_session_id();
    all_passed &= test_spawn_failures();
    all_passed &= test_stop_session();
    all_passed &= test_exit_status_mapping();
    all_passed &= test_kill_escalation();
    all_passed &= test_remove_session();
    all_passed &= test_reap_finished_sessions();
    all_passed &= test_status_list_and_metadata();
    all_passed &= test_carriage_return_progress();
    return all_passed;
}

} // namespace test_session_supervisor
