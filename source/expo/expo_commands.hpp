#ifndef RNMCPS_EXPO_COMMANDS_HPP
#define RNMCPS_EXPO_COMMANDS_HPP

// Argument vectors and session ids for the Expo CLI invocations, and the
// keystroke mapping for commands sent to a running dev server.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace expo_commands {

constexpr int kDefaultDevServerPort = 19000;

struct DevServerConfig {
    std::string platform = "all"; // ios | android | web | all
    bool clear_cache = false;
    int port = kDefaultDevServerPort;
    bool offline = false;
};

struct LocalBuildConfig {
    std::string platform;         // ios | android
    std::string device;           // empty = default device
    std::string variant = "debug"; // debug | release
    bool clean = false;
};

bool is_valid_dev_platform(const std::string &platform);
bool is_valid_build_platform(const std::string &platform);

// npx expo start [--<platform>] [--clear] [--port N] [--offline]
std::vector<std::string> build_dev_server_command(const DevServerConfig &config);

// npx expo run:<platform> [--device D] [--variant release] [--clear]
std::vector<std::string> build_local_build_command(const LocalBuildConfig &config);

// "expo-<kind>-<platform>-<epoch_ms>", kind is "dev" or "build".
std::string make_session_id(const std::string &kind, const std::string &platform, int64_t epoch_milliseconds);

// Keystrokes the dev server's interactive prompt understands. Returns nullopt
// for unknown commands, and for "custom" without custom_input.
std::optional<std::string> dev_command_input(const std::string &command, const std::string &custom_input);

// Names accepted by dev_command_input.
const std::vector<std::string> &dev_command_names();

} // namespace expo_commands

#endif // RNMCPS_EXPO_COMMANDS_HPP
