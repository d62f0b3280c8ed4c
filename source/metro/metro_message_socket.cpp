#include "metro/metro_message_socket.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <mutex>
#include <vector>

namespace metro_message_socket {

static constexpr int kProtocolVersion = 2;

// State of one broadcast connection, reached from the callback through the
// connection's user pointer.
struct BroadcastState {
    std::string payload;
    bool connected = false;
    bool sent = false;
    bool closed = false;
    bool connection_failed = false;
    std::string error_message;
};

// lws contexts are created per broadcast; serialize them so two tool calls
// never service the same loop.
static std::mutex broadcast_mutex;

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols websocket_protocols[] = {
    {
        "metro-message",
        websocket_callback,
        0,   // per-session data size
        4096 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)incoming_length;
    auto *state = static_cast<BroadcastState *>(user_data);
    if (state == nullptr) {
        return 0;
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        state->connected = true;
        debug_log::log("Message socket connected.");
        lws_callback_on_writable(websocket_instance);
        break;

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        if (state->sent) {
            break;
        }
        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + state->payload.size());
        memcpy(send_buffer.data() + LWS_PRE, state->payload.data(), state->payload.size());
        int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE, state->payload.size(),
                                      LWS_WRITE_TEXT);
        if (bytes_written < static_cast<int>(state->payload.size())) {
            state->error_message = "Failed to write to message socket";
            state->connection_failed = true;
            return -1;
        }
        state->sent = true;
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE:
        // Broadcasts have no reply; anything the server pushes is ignored.
        break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_text = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        debug_log::log("Message socket connection error (LWS): " + std::string(error_text));
        state->error_message = "Could not connect to message socket: " + std::string(error_text);
        state->connection_failed = true;
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        state->closed = true;
        break;

    default:
        break;
    }

    return 0;
}

std::optional<BroadcastCommand> command_for(const std::string &dev_command) {
    if (dev_command == "reload") {
        return BroadcastCommand{"reload", nullptr};
    }
    if (dev_command == "toggle_inspector") {
        return BroadcastCommand{"sendDevCommand", json{{"name", "toggleElementInspector"}}};
    }
    if (dev_command == "toggle_performance_monitor") {
        return BroadcastCommand{"sendDevCommand", json{{"name", "togglePerformanceMonitor"}}};
    }
    if (dev_command == "dev_menu") {
        return BroadcastCommand{"devMenu", nullptr};
    }
    return std::nullopt;
}

std::string build_broadcast_message(const BroadcastCommand &command) {
    json message;
    message["version"] = kProtocolVersion;
    message["method"] = command.method;
    if (!command.params.is_null()) {
        message["params"] = command.params;
    }
    return message.dump();
}

std::string message_socket_url(const std::string &host, int port) {
    return "ws://" + host + ":" + std::to_string(port) + "/message";
}

BroadcastResult broadcast(const std::string &host, int port, const BroadcastCommand &command,
                          int timeout_milliseconds) {
    BroadcastResult result;
    if (port <= 0 || port > 65535) {
        result.error_message = "Invalid message socket port: " + std::to_string(port);
        return result;
    }

    std::lock_guard<std::mutex> lock(broadcast_mutex);
    debug_log::log("broadcast " + command.method + " to " + message_socket_url(host, port));

    BroadcastState state;
    state.payload = build_broadcast_message(command);

    lws_set_log_level(LLL_ERR, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    struct lws_context *websocket_context = lws_create_context(&context_info);
    if (websocket_context == nullptr) {
        result.error_message = "Failed to create libwebsockets context";
        return result;
    }

    std::string path = "/message";
    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;
    connect_info.userdata = &state;

    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        lws_context_destroy(websocket_context);
        result.error_message = "Failed to initiate message socket connection";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.sent && !state.connection_failed && !state.closed) {
        lws_service(websocket_context, 50);

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            state.error_message = "Timed out connecting to message socket (after " +
                                  std::to_string(timeout_milliseconds) + " ms)";
            break;
        }
    }

    if (state.sent) {
        // Let a partially written frame drain before the context goes away.
        lws_service(websocket_context, 50);
    }
    lws_context_destroy(websocket_context);

    if (!state.sent) {
        result.error_message = state.error_message.empty() ? "Message socket closed before the command was sent"
                                                           : state.error_message;
        return result;
    }
    result.success = true;
    return result;
}

} // namespace metro_message_socket
