// Tests for the local build verdict and the build read path.

#include "expo/local_build_monitor.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>

namespace test_local_build_monitor {

using local_build_monitor::BuildVerdict;
using session_types::SessionStatus;
using test_support::shell;

static log_classifier::BuildCompletion completion(bool complete, std::optional<bool> success) {
    log_classifier::BuildCompletion result;
    result.complete = complete;
    result.success = success;
    return result;
}

// Test: The four-way verdict table.
static bool test_derive_verdict() {
    bool success =
        local_build_monitor::derive_verdict(completion(true, true), SessionStatus::Running) == BuildVerdict::Success &&
        local_build_monitor::derive_verdict(completion(true, false), SessionStatus::Error) == BuildVerdict::Failed &&
        // A completion marker outranks a stop.
        local_build_monitor::derive_verdict(completion(true, true), SessionStatus::Stopped) == BuildVerdict::Success &&
        local_build_monitor::derive_verdict(completion(false, std::nullopt), SessionStatus::Stopped) ==
            BuildVerdict::Cancelled &&
        local_build_monitor::derive_verdict(completion(false, std::nullopt), SessionStatus::Running) ==
            BuildVerdict::Building &&
        local_build_monitor::derive_verdict(completion(false, std::nullopt), SessionStatus::Error) ==
            BuildVerdict::Building;

    if (success) {
        std::cout << "  OK: Verdict table matches" << std::endl;
    } else {
        std::cout << "  FAIL: Verdict table mismatch" << std::endl;
    }
    return success;
}

// Test: A build that prints BUILD SUCCEEDED reads as success with progress.
static bool test_read_successful_build() {
    const std::string id = "build-success";
    auto start = session_supervisor::start_session(
        id, shell("echo '\xE2\x96\xB8 Compiling AppDelegate.mm'; echo '[3/4] Linking'; "
                  "echo '** BUILD SUCCEEDED **'; exec sleep 30"));
    test_support::wait_until([&id] { return session_supervisor::read_output(id, 0).total_captured >= 3; });
    auto build = local_build_monitor::read_build(id, 100);

    bool success = start.success && build.success && build.verdict == BuildVerdict::Success &&
                   build.logs.size() == 3 && build.progress && *build.progress == 75 &&
                   !build.stage.empty() && build.errors.empty();
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: Successful build detected with progress 75" << std::endl;
    } else {
        std::cout << "  FAIL: Build read verdict " << local_build_monitor::verdict_to_string(build.verdict) << std::endl;
    }
    return success;
}

// Test: A failed build reports its error lines.
static bool test_read_failed_build() {
    const std::string id = "build-failed";
    auto start = session_supervisor::start_session(
        id, shell("echo 'error: no such module ExpoModulesCore'; echo '** BUILD FAILED **'; exit 65"));
    test_support::wait_for_exit(id);
    auto build = local_build_monitor::read_build(id, 100);

    bool success = start.success && build.success && build.verdict == BuildVerdict::Failed &&
                   build.session_status == SessionStatus::Error &&
                   !build.errors.empty() && build.errors[0] == "error: no such module ExpoModulesCore";
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: Failed build detected with error lines" << std::endl;
    } else {
        std::cout << "  FAIL: Failed build verdict " << local_build_monitor::verdict_to_string(build.verdict) << std::endl;
    }
    return success;
}

// Test: Stopping an unfinished build reads as cancelled.
static bool test_read_cancelled_build() {
    const std::string id = "build-cancelled";
    auto start = session_supervisor::start_session(id, shell("echo '> Task :app:preBuild'; exec sleep 30"));
    test_support::wait_until([&id] { return session_supervisor::read_output(id, 0).total_captured >= 1; });
    auto building = local_build_monitor::read_build(id, 100);
    session_supervisor::stop_session(id);
    auto cancelled = local_build_monitor::read_build(id, 100);

    bool success = start.success && building.verdict == BuildVerdict::Building && building.stage == "preBuild" &&
                   cancelled.verdict == BuildVerdict::Cancelled;
    test_support::discard_session(id);

    if (success) {
        std::cout << "  OK: Building before stop, cancelled after" << std::endl;
    } else {
        std::cout << "  FAIL: Cancel verdict mismatch" << std::endl;
    }
    return success;
}

// Test: Unknown session.
static bool test_read_unknown_session() {
    auto build = local_build_monitor::read_build("build-unknown", 100);
    bool success = !build.success && build.error_kind == session_types::ErrorKind::SessionNotFound;

    if (success) {
        std::cout << "  OK: Unknown build session reported" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown build session not reported" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_derive_verdict();
    all_passed &= test_read_successful_build();
    all_passed &= test_read_failed_build();
    all_passed &= test_read_cancelled_build();
    all_passed &= test_read_unknown_session();
    return all_passed;
}

} // namespace test_local_build_monitor
