#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/session_supervisor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_dev_stop".

static json handle_expo_dev_stop(const json &arguments) {
    std::string session_id;
    std::string error;
    if (!tool_arguments::require_string(arguments, "session_id", session_id, error)) {
        return mcp_tools::error_result(error);
    }

    session_supervisor::SessionResult stop_result = session_supervisor::stop_session(session_id);
    if (!stop_result.success) {
        return mcp_tools::error_result(stop_result.error_message);
    }

    json payload;
    payload["success"] = true;
    payload["session_id"] = session_id;
    payload["message"] = "Development server stopped";
    return mcp_tools::json_result(payload);
}

namespace tool_expo_dev_stop {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["session_id"] = {
        {"type", "string"},
        {"description", "Session id returned by expo_dev_start."}
    };
    input_schema["required"] = json::array({"session_id"});

    mcp_tools::register_tool({
        "expo_dev_stop",
        "Stop an Expo dev server session. The session's logs stay readable until it is removed.",
        input_schema,
        handle_expo_dev_stop
    });
}

} // namespace tool_expo_dev_stop
