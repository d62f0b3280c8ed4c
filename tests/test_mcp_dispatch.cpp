// Tests for JSON-RPC routing, stdio framing and tool argument validation.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace test_mcp_dispatch {

using json = nlohmann::json;

static json call_tool(const std::string &name, const json &arguments) {
    json request = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                    {"params", {{"name", name}, {"arguments", arguments}}}};
    return mcp_dispatch::dispatch_message(request);
}

static std::string result_text(const json &response) {
    if (!response.contains("result") || !response["result"].contains("content") ||
        response["result"]["content"].empty()) {
        return "";
    }
    return response["result"]["content"][0].value("text", "");
}

static bool is_tool_error(const json &response) {
    return response.contains("result") && response["result"].value("isError", false);
}

// Test: initialize reports the server and protocol version.
static bool test_initialize() {
    json response = mcp_dispatch::dispatch_message(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}});
    bool success = response["id"] == 1 && response["result"]["protocolVersion"] == "2024-11-05" &&
                   response["result"]["serverInfo"]["name"] == "rnmcps" &&
                   response["result"]["capabilities"].contains("tools");

    if (success) {
        std::cout << "  OK: initialize" << std::endl;
    } else {
        std::cout << "  FAIL: initialize: " << response.dump() << std::endl;
    }
    return success;
}

// Test: tools/list exposes every tool with a schema.
static bool test_tools_list() {
    json response = mcp_dispatch::dispatch_message({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    const json &tools = response["result"]["tools"];
    bool success = tools.is_array() && tools.size() == 9;
    for (const auto &tool : tools) {
        success = success && tool.contains("name") && tool.contains("inputSchema");
    }

    if (success) {
        std::cout << "  OK: tools/list returns 9 tools" << std::endl;
    } else {
        std::cout << "  FAIL: tools/list: " << tools.size() << " tools" << std::endl;
    }
    return success;
}

// Test: ping, notifications and unknown methods.
static bool test_protocol_methods() {
    json ping = mcp_dispatch::dispatch_message({{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
    json notification = mcp_dispatch::dispatch_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    json unknown = mcp_dispatch::dispatch_message({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "resources/list"}});
    json no_method = mcp_dispatch::dispatch_message({{"jsonrpc", "2.0"}, {"id", 4}});

    bool success = ping["result"] == json::object() && notification.is_null() &&
                   unknown["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                   no_method["error"]["code"] == json_rpc::INVALID_REQUEST && no_method["id"] == 4;

    if (success) {
        std::cout << "  OK: ping, notification and unknown method" << std::endl;
    } else {
        std::cout << "  FAIL: protocol methods" << std::endl;
    }
    return success;
}

// Test: Unparseable input yields a parse error with a null id.
static bool test_parse_error() {
    json response = mcp_dispatch::handle_raw_message("{\"jsonrpc\": \"2.0\", \"id\": ");
    bool success = response["error"]["code"] == json_rpc::PARSE_ERROR && response["id"].is_null();

    if (success) {
        std::cout << "  OK: Parse error response" << std::endl;
    } else {
        std::cout << "  FAIL: Parse error response: " << response.dump() << std::endl;
    }
    return success;
}

// Test: tools/call without a name, and an unknown tool.
static bool test_tools_call_errors() {
    json missing_name = mcp_dispatch::dispatch_message(
        {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"}, {"params", json::object()}});
    json unknown_tool = call_tool("expo_teleport", json::object());

    bool success = missing_name["error"]["code"] == json_rpc::INVALID_PARAMS && is_tool_error(unknown_tool) &&
                   result_text(unknown_tool) == "Unknown tool: expo_teleport";

    if (success) {
        std::cout << "  OK: tools/call errors" << std::endl;
    } else {
        std::cout << "  FAIL: tools/call errors" << std::endl;
    }
    return success;
}

// Test: Argument validation in the tool handlers.
static bool test_tool_argument_validation() {
    json missing_session = call_tool("expo_dev_read", json::object());
    json unknown_session = call_tool("expo_dev_stop", {{"session_id", "expo-dev-ios-0"}});
    json custom_without_input = call_tool("expo_dev_send", {{"session_id", "expo-dev-ios-0"}, {"command", "custom"}});
    json web_build = call_tool("expo_build_local_start", {{"platform", "web"}});
    json wrong_type = call_tool("expo_dev_read", {{"session_id", "expo-dev-ios-0"}, {"tail", "ten"}});

    bool success = is_tool_error(missing_session) &&
                   result_text(missing_session).find("session_id") != std::string::npos &&
                   is_tool_error(unknown_session) &&
                   result_text(unknown_session).find("Session not found") != std::string::npos &&
                   is_tool_error(custom_without_input) &&
                   result_text(custom_without_input) == "custom_input required when command is \"custom\"" &&
                   is_tool_error(web_build) && result_text(web_build).find("platform") != std::string::npos &&
                   is_tool_error(wrong_type);

    if (success) {
        std::cout << "  OK: Tool argument validation" << std::endl;
    } else {
        std::cout << "  FAIL: Tool argument validation" << std::endl;
    }
    return success;
}

// Test: Float integers are accepted only when they fit a long long.
static bool test_integer_argument_range() {
    long long value = 7;
    std::string error;
    bool whole_float = tool_arguments::read_integer(json{{"tail", 50.0}}, "tail", value, error) && value == 50;

    long long untouched = 7;
    std::string huge_error;
    std::string tiny_error;
    std::string edge_error;
    bool huge = tool_arguments::read_integer(json{{"port", 1e20}}, "port", untouched, huge_error);
    bool tiny = tool_arguments::read_integer(json{{"tail", -1e300}}, "tail", untouched, tiny_error);
    bool edge = tool_arguments::read_integer(json{{"tail", 9223372036854775808.0}}, "tail", untouched, edge_error);

    json dev_start = call_tool("expo_dev_start", {{"port", 1e20}});
    json dev_read = call_tool("expo_dev_read", {{"session_id", "expo-dev-ios-0"}, {"tail", -1e300}});

    bool success = whole_float && !huge && !tiny && !edge && untouched == 7 &&
                   huge_error == "Parameter 'port' must be an integer." &&
                   is_tool_error(dev_start) && result_text(dev_start) == "Parameter 'port' must be an integer." &&
                   is_tool_error(dev_read) && result_text(dev_read) == "Parameter 'tail' must be an integer.";

    if (success) {
        std::cout << "  OK: Out-of-range numbers rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Out-of-range numbers accepted" << std::endl;
    }
    return success;
}

// Test: Protocol output waits for the lock that debug logging holds.
static bool test_output_shares_log_lock() {
    std::ostringstream output;
    std::thread writer;
    bool written_while_locked = false;
    {
        std::lock_guard<std::mutex> lock(debug_log::output_mutex());
        writer = std::thread([&output] { mcp_stdio::write_message("{\"id\":1}", output); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        written_while_locked = !output.str().empty();
    }
    writer.join();

    bool success = !written_while_locked && output.str() == "{\"id\":1}\n";

    if (success) {
        std::cout << "  OK: stdout and stderr writers share one lock" << std::endl;
    } else {
        std::cout << "  FAIL: Protocol output bypassed the log lock" << std::endl;
    }
    return success;
}

// Test: Session list payload shape.
static bool test_session_list_payload() {
    json response = call_tool("expo_session_list", json::object());
    bool success = !is_tool_error(response);
    if (success) {
        json payload = json::parse(result_text(response));
        success = payload["sessions"].is_array() && payload["count"] == payload["sessions"].size();
    }

    if (success) {
        std::cout << "  OK: Session list payload" << std::endl;
    } else {
        std::cout << "  FAIL: Session list payload" << std::endl;
    }
    return success;
}

// Test: Brace-counting framing, including braces inside strings.
static bool test_read_message_framing() {
    std::istringstream input("  {\"a\":\"}{\\\"\",\"b\":{\"c\":1}}\n{\"d\":2}");
    std::string first = mcp_stdio::read_message(input);
    std::string second = mcp_stdio::read_message(input);
    std::string third = mcp_stdio::read_message(input);

    bool success = first == "{\"a\":\"}{\\\"\",\"b\":{\"c\":1}}" && second == "{\"d\":2}" && third.empty();

    if (success) {
        std::cout << "  OK: stdio message framing" << std::endl;
    } else {
        std::cout << "  FAIL: stdio message framing: " << first << std::endl;
    }
    return success;
}

bool run_all_tests() {
    mcp_tools::clear_registry();
    tool_handlers::register_all_tools();

    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_tools_list();
    all_passed &= test_protocol_methods();
    all_passed &= test_parse_error();
    all_passed &= test_tools_call_errors();
    all_passed &= test_tool_argument_validation();
    all_passed &= test_integer_argument_range();
    all_passed &= test_session_list_payload();
    all_passed &= test_output_shares_log_lock();
    all_passed &= test_read_message_framing();
    return all_passed;
}

} // namespace test_mcp_dispatch
