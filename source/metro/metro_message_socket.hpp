#ifndef RNMCPS_METRO_MESSAGE_SOCKET_HPP
#define RNMCPS_METRO_MESSAGE_SOCKET_HPP

// Client for the dev server's message socket (ws://127.0.0.1:<port>/message).
// A message without an id is broadcast by the server to every connected app,
// which is how dev commands reach a running app without the terminal prompt.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace metro_message_socket {

using json = nlohmann::json;

constexpr int kDefaultConnectTimeoutMilliseconds = 5000;

struct BroadcastCommand {
    std::string method;
    json params; // null = no params
};

// Maps a dev command name (reload, toggle_inspector,
// toggle_performance_monitor, dev_menu) to its broadcast. nullopt if the
// command has no message-socket equivalent.
std::optional<BroadcastCommand> command_for(const std::string &dev_command);

// {"version":2,"method":<method>,"params":<params>}; params omitted when null.
std::string build_broadcast_message(const BroadcastCommand &command);

std::string message_socket_url(const std::string &host, int port);

struct BroadcastResult {
    bool success = false;
    std::string error_message;
};

// Connect, send one broadcast, close. Blocks up to timeout_milliseconds.
BroadcastResult broadcast(const std::string &host, int port, const BroadcastCommand &command,
                          int timeout_milliseconds = kDefaultConnectTimeoutMilliseconds);

} // namespace metro_message_socket

#endif // RNMCPS_METRO_MESSAGE_SOCKET_HPP
