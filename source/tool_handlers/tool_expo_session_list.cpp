#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/session_supervisor.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

// Tool handler for "expo_session_list".
// Lists every session the supervisor knows about, live or finished.

static json handle_expo_session_list(const json &arguments) {
    (void)arguments;

    std::vector<session_supervisor::SessionInfo> sessions = session_supervisor::list_sessions();

    json sessions_array = json::array();
    for (const auto &session : sessions) {
        std::ostringstream command_stream;
        for (size_t index = 0; index < session.command.size(); index++) {
            if (index > 0) {
                command_stream << ' ';
            }
            command_stream << session.command[index];
        }

        json session_entry;
        session_entry["id"] = session.id;
        session_entry["status"] = session_types::status_to_string(session.status);
        session_entry["uptime_ms"] = session.uptime_ms;
        session_entry["log_count"] = session.log_count;
        session_entry["command"] = command_stream.str();
        session_entry["cwd"] = session.cwd;
        sessions_array.push_back(session_entry);
    }

    json payload;
    payload["sessions"] = sessions_array;
    payload["count"] = sessions.size();
    return mcp_tools::json_result(payload);
}

namespace tool_expo_session_list {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "expo_session_list",
        "List all dev server and build sessions with their status, uptime and number of retained log lines.",
        input_schema,
        handle_expo_session_list
    });
}

} // namespace tool_expo_session_list
