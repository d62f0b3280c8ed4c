#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "expo/expo_commands.hpp"
#include "metro/metro_message_socket.hpp"
#include "session/session_supervisor.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

// Tool handler for "expo_dev_send".
// Delivers a dev command to a running dev server, either as keystrokes on the
// session's stdin or as a broadcast on the dev server's message socket.

static std::vector<std::string> accepted_commands() {
    std::vector<std::string> commands = expo_commands::dev_command_names();
    commands.push_back("dev_menu");
    return commands;
}

static json send_over_message_socket(const std::string &session_id, const std::string &command) {
    auto broadcast_command = metro_message_socket::command_for(command);
    if (!broadcast_command) {
        return mcp_tools::error_result("Command '" + command + "' is not available over the message socket.");
    }

    session_supervisor::StatusResult status = session_supervisor::get_status(session_id);
    if (!status.success) {
        return mcp_tools::error_result(status.error_message);
    }
    if (status.status != session_types::SessionStatus::Running) {
        return mcp_tools::error_result("Session is not running: " + session_id);
    }

    session_supervisor::MetadataResult port_value = session_supervisor::get_metadata(session_id, "port");
    if (!port_value.success || !port_value.value) {
        return mcp_tools::error_result("Dev server port is unknown for session " + session_id +
                                       " (was it started with expo_dev_start?)");
    }
    int port = 0;
    try {
        port = std::stoi(*port_value.value);
    } catch (const std::exception &) {
        return mcp_tools::error_result("Invalid dev server port '" + *port_value.value + "' for session " + session_id);
    }

    metro_message_socket::BroadcastResult broadcast_result =
        metro_message_socket::broadcast("127.0.0.1", port, *broadcast_command);
    if (!broadcast_result.success) {
        return mcp_tools::error_result("Failed to send command: " + broadcast_result.error_message);
    }

    json payload;
    payload["success"] = true;
    payload["command"] = command;
    payload["transport"] = "message_socket";
    payload["message"] = "Command '" + command + "' broadcast to connected apps";
    return mcp_tools::json_result(payload);
}

static json handle_expo_dev_send(const json &arguments) {
    std::string session_id;
    std::string command;
    std::string custom_input;
    std::string transport = "stdin";
    std::string error;

    if (!tool_arguments::require_string(arguments, "session_id", session_id, error) ||
        !tool_arguments::require_string(arguments, "command", command, error) ||
        !tool_arguments::read_string(arguments, "custom_input", custom_input, error) ||
        !tool_arguments::read_enum(arguments, "transport", {"stdin", "message_socket"}, transport, error)) {
        return mcp_tools::error_result(error);
    }

    debug_log::log("expo_dev_send: " + command + " via " + transport + " to " + session_id);
    if (transport == "message_socket") {
        return send_over_message_socket(session_id, command);
    }

    if (command == "custom" && custom_input.empty()) {
        return mcp_tools::error_result("custom_input required when command is \"custom\"");
    }
    std::optional<std::string> input = expo_commands::dev_command_input(command, custom_input);
    if (!input) {
        return mcp_tools::error_result("Unknown command: " + command);
    }

    session_supervisor::SessionResult send_result = session_supervisor::send_input(session_id, *input);
    if (!send_result.success) {
        return mcp_tools::error_result(send_result.error_message);
    }

    json payload;
    payload["success"] = true;
    payload["command"] = command;
    payload["transport"] = "stdin";
    payload["message"] = "Command '" + command + "' sent to dev server";
    return mcp_tools::json_result(payload);
}

namespace tool_expo_dev_send {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["session_id"] = {
        {"type", "string"},
        {"description", "Session id returned by expo_dev_start."}
    };
    input_schema["properties"]["command"] = tool_arguments::enum_property(
        accepted_commands(),
        "Dev command. dev_menu is only available with transport=message_socket.");
    input_schema["properties"]["custom_input"] = {
        {"type", "string"},
        {"description", "Text written to the dev server's stdin when command is custom."}
    };
    input_schema["properties"]["transport"] = tool_arguments::enum_property(
        {"stdin", "message_socket"},
        "stdin types into the dev server prompt (default); message_socket broadcasts to connected apps.");
    input_schema["required"] = json::array({"session_id", "command"});

    mcp_tools::register_tool({
        "expo_dev_send",
        "Send a command to a running Expo dev server session: reload, clear_cache, toggle_inspector, "
        "toggle_performance_monitor, open_ios, open_android, open_web, or custom text.",
        input_schema,
        handle_expo_dev_send
    });
}

} // namespace tool_expo_dev_send
