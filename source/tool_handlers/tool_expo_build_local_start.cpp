#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "expo/expo_commands.hpp"
#include "platform/platform_abi.hpp"
#include "session/session_supervisor.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_build_local_start".
// Starts `expo run:<platform>` in a session and returns immediately; progress
// is read with expo_build_local_read.

static json handle_expo_build_local_start(const json &arguments) {
    expo_commands::LocalBuildConfig config;
    std::string error;

    if (!tool_arguments::require_string(arguments, "platform", config.platform, error) ||
        !tool_arguments::read_string(arguments, "device", config.device, error) ||
        !tool_arguments::read_enum(arguments, "variant", {"debug", "release"}, config.variant, error) ||
        !tool_arguments::read_bool(arguments, "clean", config.clean, error)) {
        return mcp_tools::error_result(error);
    }
    if (!expo_commands::is_valid_build_platform(config.platform)) {
        return mcp_tools::error_result("Parameter 'platform' must be one of: ios, android.");
    }

    std::string session_id =
        expo_commands::make_session_id("build", config.platform, platform::now_epoch_milliseconds());

    session_supervisor::StartOptions start_options;
    start_options.metadata["kind"] = "build";
    start_options.metadata["platform"] = config.platform;
    start_options.metadata["variant"] = config.variant;

    debug_log::log("Starting local " + config.platform + " build " + session_id);
    session_supervisor::SessionResult start_result = session_supervisor::start_session(
        session_id, expo_commands::build_local_build_command(config), start_options);
    if (!start_result.success) {
        return mcp_tools::error_result("Failed to start local build: " + start_result.error_message);
    }

    json payload;
    payload["session_id"] = session_id;
    payload["status"] = "building";
    payload["message"] = "Local " + config.platform + " build started. Use expo_build_local_read to follow progress.";
    payload["platform"] = config.platform;
    return mcp_tools::json_result(payload);
}

namespace tool_expo_build_local_start {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["platform"] = tool_arguments::enum_property(
        {"ios", "android"}, "Native platform to build and run.");
    input_schema["properties"]["device"] = {
        {"type", "string"},
        {"description", "Device or simulator name or id. Default: the CLI's choice."}
    };
    input_schema["properties"]["variant"] = tool_arguments::enum_property(
        {"debug", "release"}, "Build variant. Default: debug.");
    input_schema["properties"]["clean"] = {
        {"type", "boolean"},
        {"description", "Clear caches before building. Default: false."}
    };
    input_schema["required"] = json::array({"platform"});

    mcp_tools::register_tool({
        "expo_build_local_start",
        "Start a local native build (expo run:ios / expo run:android) in a persistent session. "
        "Returns immediately with a session_id; poll expo_build_local_read for progress.",
        input_schema,
        handle_expo_build_local_start
    });
}

} // namespace tool_expo_build_local_start
