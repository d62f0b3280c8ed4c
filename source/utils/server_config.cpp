#include "utils/server_config.hpp"
#include "utils/debug_log.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace server_config {

static ServerConfig current_config;

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

static int clamp_to_int(long long value) {
    if (value > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(value);
}

long long parse_positive_integer(const std::string &text, long long fallback) {
    if (text.empty()) {
        return fallback;
    }
    errno = 0;
    char *end_pointer = nullptr;
    long long value = std::strtoll(text.c_str(), &end_pointer, 10);
    if (errno != 0 || end_pointer == text.c_str() || *end_pointer != '\0' || value <= 0) {
        debug_log::warn("ignoring malformed numeric setting '" + text + "'");
        return fallback;
    }
    return value;
}

ServerConfig load() {
    ServerConfig config;
    config.debug = debug_log::is_debug_enabled();
    config.project_directory = read_environment("RNMCPS_PROJECT_DIR");

    config.log_capacity = static_cast<std::size_t>(parse_positive_integer(
        read_environment("RNMCPS_LOG_CAPACITY"), static_cast<long long>(config.log_capacity)));
    config.dev_start_timeout_milliseconds = clamp_to_int(parse_positive_integer(
        read_environment("RNMCPS_DEV_START_TIMEOUT_MS"), config.dev_start_timeout_milliseconds));
    config.poll_interval_milliseconds = clamp_to_int(parse_positive_integer(
        read_environment("RNMCPS_POLL_INTERVAL_MS"), config.poll_interval_milliseconds));
    config.kill_grace_milliseconds = clamp_to_int(parse_positive_integer(
        read_environment("RNMCPS_KILL_GRACE_MS"), config.kill_grace_milliseconds));
    config.session_retention_milliseconds = clamp_to_int(parse_positive_integer(
        read_environment("RNMCPS_SESSION_RETENTION_MS"), config.session_retention_milliseconds));

    std::string qrencode = read_environment("RNMCPS_QRENCODE");
    if (!qrencode.empty()) {
        config.qrencode_executable = qrencode;
    }

    return config;
}

const ServerConfig &current() {
    return current_config;
}

void set_current(const ServerConfig &config) {
    current_config = config;
}

} // namespace server_config
