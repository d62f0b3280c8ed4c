#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/session_supervisor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_session_remove".
// Drops a finished session and its logs. Live sessions must be stopped first.

static json handle_expo_session_remove(const json &arguments) {
    std::string session_id;
    std::string error;
    if (!tool_arguments::require_string(arguments, "session_id", session_id, error)) {
        return mcp_tools::error_result(error);
    }

    session_supervisor::SessionResult remove_result = session_supervisor::remove_session(session_id);
    if (!remove_result.success) {
        return mcp_tools::error_result(remove_result.error_message);
    }
    return mcp_tools::text_result("Removed session " + session_id);
}

namespace tool_expo_session_remove {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["session_id"] = {
        {"type", "string"},
        {"description", "Id of a stopped or failed session."}
    };
    input_schema["required"] = json::array({"session_id"});

    mcp_tools::register_tool({
        "expo_session_remove",
        "Remove a finished (stopped or failed) session and discard its logs. "
        "Finished sessions are also removed automatically some time after they end.",
        input_schema,
        handle_expo_session_remove
    });
}

} // namespace tool_expo_session_remove
