#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "expo/local_build_monitor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_build_local_read".
// Reports building / success / failed / cancelled for a local build session.

static constexpr long long kDefaultTail = 100;

static json handle_expo_build_local_read(const json &arguments) {
    std::string session_id;
    long long tail = kDefaultTail;
    std::string error;
    if (!tool_arguments::require_string(arguments, "session_id", session_id, error) ||
        !tool_arguments::read_integer(arguments, "tail", tail, error)) {
        return mcp_tools::error_result(error);
    }
    if (tail < 0) {
        return mcp_tools::error_result("Parameter 'tail' must not be negative.");
    }

    local_build_monitor::BuildReadResult build =
        local_build_monitor::read_build(session_id, static_cast<std::size_t>(tail));
    if (!build.success) {
        return mcp_tools::error_result(build.error_message);
    }

    json payload;
    payload["logs"] = build.logs;
    payload["status"] = local_build_monitor::verdict_to_string(build.verdict);
    payload["session_status"] = session_types::status_to_string(build.session_status);
    if (build.progress) {
        payload["progress"] = *build.progress;
    }
    if (!build.stage.empty()) {
        payload["stage"] = build.stage;
    }
    if (!build.errors.empty()) {
        payload["errors"] = build.errors;
    }
    return mcp_tools::json_result(payload);
}

namespace tool_expo_build_local_read {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["session_id"] = {
        {"type", "string"},
        {"description", "Session id returned by expo_build_local_start."}
    };
    input_schema["properties"]["tail"] = {
        {"type", "integer"},
        {"default", kDefaultTail},
        {"description", "Number of most recent log lines to inspect and return (0 = all retained lines)."}
    };
    input_schema["required"] = json::array({"session_id"});

    mcp_tools::register_tool({
        "expo_build_local_read",
        "Read a local build session: status is building, success, failed or cancelled, derived from the "
        "build output. Also returns the raw log lines, the current build stage and percentage when the "
        "build tool reports them, and any error lines.",
        input_schema,
        handle_expo_build_local_read
    });
}

} // namespace tool_expo_build_local_read
