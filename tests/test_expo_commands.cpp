// Tests for Expo CLI argument vectors and dev command keystrokes.

#include "expo/expo_commands.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace test_expo_commands {

static bool contains(const std::vector<std::string> &argv, const std::string &value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}

// Test: ios + clear cache produces the platform and --clear flags.
static bool test_dev_server_ios_clear() {
    expo_commands::DevServerConfig config;
    config.platform = "ios";
    config.clear_cache = true;
    auto argv = expo_commands::build_dev_server_command(config);

    bool success = argv.size() >= 3 && argv[0] == "npx" && argv[1] == "expo" && argv[2] == "start" &&
                   contains(argv, "--ios") && contains(argv, "--clear") && !contains(argv, "--offline");

    if (success) {
        std::cout << "  OK: ios dev server argv" << std::endl;
    } else {
        std::cout << "  FAIL: ios dev server argv" << std::endl;
    }
    return success;
}

// Test: "all" adds no platform flag; port and offline are passed through.
static bool test_dev_server_all_port_offline() {
    expo_commands::DevServerConfig config;
    config.port = 8082;
    config.offline = true;
    auto argv = expo_commands::build_dev_server_command(config);

    std::vector<std::string> expected = {"npx", "expo", "start", "--port", "8082", "--offline"};
    bool success = argv == expected;

    if (success) {
        std::cout << "  OK: all-platform argv with port and offline" << std::endl;
    } else {
        std::cout << "  FAIL: all-platform argv mismatch" << std::endl;
    }
    return success;
}

// Test: Local build argv for a release build on a named device.
static bool test_local_build_command() {
    expo_commands::LocalBuildConfig release;
    release.platform = "android";
    release.device = "Pixel_7";
    release.variant = "release";
    release.clean = true;
    std::vector<std::string> expected = {"npx", "expo", "run:android", "--device", "Pixel_7",
                                         "--variant", "release", "--clear"};

    expo_commands::LocalBuildConfig debug;
    debug.platform = "ios";
    std::vector<std::string> expected_debug = {"npx", "expo", "run:ios"};

    bool success = expo_commands::build_local_build_command(release) == expected &&
                   expo_commands::build_local_build_command(debug) == expected_debug;

    if (success) {
        std::cout << "  OK: Local build argv" << std::endl;
    } else {
        std::cout << "  FAIL: Local build argv mismatch" << std::endl;
    }
    return success;
}

// Test: Platform validation.
static bool test_platform_validation() {
    bool success = expo_commands::is_valid_dev_platform("web") && expo_commands::is_valid_dev_platform("all") &&
                   !expo_commands::is_valid_dev_platform("windows") &&
                   expo_commands::is_valid_build_platform("ios") &&
                   !expo_commands::is_valid_build_platform("web") &&
                   !expo_commands::is_valid_build_platform("all");

    if (success) {
        std::cout << "  OK: Platform validation" << std::endl;
    } else {
        std::cout << "  FAIL: Platform validation" << std::endl;
    }
    return success;
}

// Test: Session id format.
static bool test_make_session_id() {
    bool success = expo_commands::make_session_id("dev", "ios", 1700000000123) == "expo-dev-ios-1700000000123" &&
                   expo_commands::make_session_id("build", "android", 5) == "expo-build-android-5";

    if (success) {
        std::cout << "  OK: Session id format" << std::endl;
    } else {
        std::cout << "  FAIL: Session id format" << std::endl;
    }
    return success;
}

// Test: Keystroke mapping, custom input and unknown commands.
static bool test_dev_command_input() {
    bool success = expo_commands::dev_command_input("reload", "") == std::optional<std::string>("r") &&
                   expo_commands::dev_command_input("clear_cache", "") == std::optional<std::string>("shift+r") &&
                   expo_commands::dev_command_input("toggle_performance_monitor", "") ==
                       std::optional<std::string>("perf") &&
                   expo_commands::dev_command_input("open_web", "") == std::optional<std::string>("w") &&
                   expo_commands::dev_command_input("custom", "j") == std::optional<std::string>("j") &&
                   !expo_commands::dev_command_input("custom", "") &&
                   !expo_commands::dev_command_input("explode", "");

    const auto &names = expo_commands::dev_command_names();
    success = success && names.size() == 8 && names.back() == "custom";

    if (success) {
        std::cout << "  OK: Dev command keystrokes" << std::endl;
    } else {
        std::cout << "  FAIL: Dev command keystrokes" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_dev_server_ios_clear();
    all_passed &= test_dev_server_all_port_offline();
    all_passed &= test_local_build_command();
    all_passed &= test_platform_validation();
    all_passed &= test_make_session_id();
    all_passed &= test_dev_command_input();
    return all_passed;
}

} // namespace test_expo_commands
