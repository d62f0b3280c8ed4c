#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <exception>

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "rnmcps";
static const std::string SERVER_VERSION = "0.1.0";
// Lets MCP clients discover that this server drives the Expo / React Native
// toolchain and suggest it for dev-server and local-build work.
static const std::string SERVER_DESCRIPTION =
    "React Native MCP server: runs the Expo dev server and local native builds "
    "as supervised sessions. Use this server to start a dev server and get its "
    "URL and QR code, send reload or inspector commands, read classified dev "
    "server or build logs, and track local iOS/Android build progress. Tools "
    "include expo_dev_start, expo_dev_send, expo_dev_read, expo_dev_stop, "
    "expo_build_local_start, expo_build_local_read and expo_session_list.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // We accept any client capabilities for now.

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id, const json &params) {
    (void)params;
    json result = mcp_tools::build_tools_list_response();
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    json tool_result;
    try {
        tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments);
    } catch (const std::exception &error) {
        mcp_stdio::log_message("Tool '" + tool_name + "' failed: " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                               "Internal error in " + tool_name + ": " + error.what());
    }
    return json_rpc::build_response(request_id, tool_result);
}

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    if (!json_rpc::is_valid_request(message)) {
        if (json_rpc::is_notification(message)) {
            return nullptr;
        }
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
    }

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        // "notifications/initialized" is the only notification we expect; acknowledge silently.
        return nullptr;
    }

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

json handle_raw_message(const std::string &raw_message) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
        return json_rpc::build_parse_error_response(error.what());
    }
    return dispatch_message(parsed_message);
}

} // namespace mcp_dispatch
