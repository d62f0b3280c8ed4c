#ifndef RNMCPS_SERVER_CONFIG_HPP
#define RNMCPS_SERVER_CONFIG_HPP

// Server configuration, read from RNMCPS_* environment variables.

#include <cstddef>
#include <string>

namespace server_config {

struct ServerConfig {
    bool debug = false;
    // Working directory for spawned tools; empty = the server's own cwd.
    std::string project_directory;
    std::size_t log_capacity = 1000;
    int dev_start_timeout_milliseconds = 60000;
    int poll_interval_milliseconds = 1000;
    int kill_grace_milliseconds = 5000;
    int session_retention_milliseconds = 600000;
    std::string qrencode_executable = "qrencode";
};

// Read the environment. Unset or malformed values keep their defaults.
ServerConfig load();

// The configuration loaded at startup (defaults until set_current is called).
const ServerConfig &current();
void set_current(const ServerConfig &config);

// Parse a positive integer; returns fallback when the text is empty, malformed
// or not strictly positive.
long long parse_positive_integer(const std::string &text, long long fallback);

} // namespace server_config

#endif // RNMCPS_SERVER_CONFIG_HPP
