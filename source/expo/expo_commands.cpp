#include "expo/expo_commands.hpp"

#include <algorithm>
#include <utility>

namespace expo_commands {

static const std::vector<std::pair<std::string, std::string>> &dev_command_table() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"reload", "r"},
        {"clear_cache", "shift+r"},
        {"toggle_inspector", "i"},
        {"toggle_performance_monitor", "perf"},
        {"open_ios", "shift+i"},
        {"open_android", "shift+a"},
        {"open_web", "w"},
    };
    return table;
}

bool is_valid_dev_platform(const std::string &platform) {
    return platform == "ios" || platform == "android" || platform == "web" || platform == "all";
}

bool is_valid_build_platform(const std::string &platform) {
    return platform == "ios" || platform == "android";
}

std::vector<std::string> build_dev_server_command(const DevServerConfig &config) {
    std::vector<std::string> argv = {"npx", "expo", "start"};
    if (config.platform != "all" && !config.platform.empty()) {
        argv.push_back("--" + config.platform);
    }
    if (config.clear_cache) {
        argv.push_back("--clear");
    }
    if (config.port > 0) {
        argv.push_back("--port");
        argv.push_back(std::to_string(config.port));
    }
    if (config.offline) {
        argv.push_back("--offline");
    }
    return argv;
}

std::vector<std::string> build_local_build_command(const LocalBuildConfig &config) {
    std::vector<std::string> argv = {"npx", "expo", "run:" + config.platform};
    if (!config.device.empty()) {
        argv.push_back("--device");
        argv.push_back(config.device);
    }
    // debug is the CLI default
    if (config.variant == "release") {
        argv.push_back("--variant");
        argv.push_back("release");
    }
    if (config.clean) {
        argv.push_back("--clear");
    }
    return argv;
}

std::string make_session_id(const std::string &kind, const std::string &platform, int64_t epoch_milliseconds) {
    return "expo-" + kind + "-" + platform + "-" + std::to_string(epoch_milliseconds);
}

std::optional<std::string> dev_command_input(const std::string &command, const std::string &custom_input) {
    if (command == "custom") {
        if (custom_input.empty()) {
            return std::nullopt;
        }
        return custom_input;
    }
    const auto &table = dev_command_table();
    auto iterator = std::find_if(table.begin(), table.end(),
                                 [&command](const auto &entry) { return entry.first == command; });
    if (iterator == table.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

const std::vector<std::string> &dev_command_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto &entry : dev_command_table()) {
            result.push_back(entry.first);
        }
        result.push_back("custom");
        return result;
    }();
    return names;
}

} // namespace expo_commands
