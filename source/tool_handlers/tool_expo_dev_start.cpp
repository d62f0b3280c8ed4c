#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "expo/expo_commands.hpp"
#include "expo/readiness_poller.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_dev_start".
// Starts `expo start` in a session and blocks until the dev server prints its
// URL, fails, or the start timeout expires.

static json handle_expo_dev_start(const json &arguments) {
    expo_commands::DevServerConfig config;
    std::string qr_format_name = "terminal";
    long long port = expo_commands::kDefaultDevServerPort;
    std::string error;

    if (!tool_arguments::read_enum(arguments, "platform", {"ios", "android", "web", "all"}, config.platform, error) ||
        !tool_arguments::read_bool(arguments, "clear_cache", config.clear_cache, error) ||
        !tool_arguments::read_integer(arguments, "port", port, error) ||
        !tool_arguments::read_enum(arguments, "qr_format", {"terminal", "svg", "png", "url"}, qr_format_name, error) ||
        !tool_arguments::read_bool(arguments, "offline", config.offline, error)) {
        return mcp_tools::error_result(error);
    }
    if (port < 1 || port > 65535) {
        return mcp_tools::error_result("Parameter 'port' must be between 1 and 65535.");
    }
    config.port = static_cast<int>(port);

    const server_config::ServerConfig &server = server_config::current();
    std::string session_id =
        expo_commands::make_session_id("dev", config.platform, platform::now_epoch_milliseconds());

    readiness_poller::ReadinessOptions options;
    options.timeout_milliseconds = server.dev_start_timeout_milliseconds;
    options.poll_interval_milliseconds = server.poll_interval_milliseconds;
    options.qr_format = qr_generator::parse_format(qr_format_name).value_or(qr_generator::QrFormat::Terminal);
    options.platform = config.platform;
    options.cancellation = &readiness_poller::shutdown_token();

    session_supervisor::StartOptions start_options;
    start_options.metadata["kind"] = "dev";
    start_options.metadata["platform"] = config.platform;

    debug_log::log("Starting Expo dev server " + session_id + " on port " + std::to_string(config.port));
    readiness_poller::ReadinessResult readiness = readiness_poller::start_and_wait(
        session_id, expo_commands::build_dev_server_command(config), start_options, options);

    if (!readiness.success) {
        return mcp_tools::error_result("Failed to start dev server: " + readiness.error_message);
    }

    json payload;
    payload["session_id"] = readiness.data.session_id;
    payload["qr_code"] = readiness.data.qr_code;
    payload["url"] = readiness.data.url;
    payload["status"] = readiness.data.status;
    payload["platform"] = readiness.data.platform;
    if (readiness.data.port) {
        payload["port"] = *readiness.data.port;
    }
    return mcp_tools::json_result(payload);
}

namespace tool_expo_dev_start {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["platform"] = tool_arguments::enum_property(
        {"ios", "android", "web", "all"}, "Platform to open the app on. Default: all.");
    input_schema["properties"]["clear_cache"] = {
        {"type", "boolean"},
        {"description", "Clear the bundler cache before starting. Default: false."}
    };
    input_schema["properties"]["port"] = {
        {"type", "integer"},
        {"description", "Dev server port. Default: 19000."}
    };
    input_schema["properties"]["qr_format"] = tool_arguments::enum_property(
        {"terminal", "svg", "png", "url"}, "How the QR code is returned. Default: terminal.");
    input_schema["properties"]["offline"] = {
        {"type", "boolean"},
        {"description", "Start without network access to Expo services. Default: false."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "expo_dev_start",
        "Start the Expo development server in a persistent session and wait until it is ready. "
        "Returns session_id (used by expo_dev_send / expo_dev_read / expo_dev_stop), the dev server URL, "
        "port and a QR code for Expo Go. Fails, and stops the session, if the server errors or is not "
        "ready within the start timeout.",
        input_schema,
        handle_expo_dev_start
    });
}

} // namespace tool_expo_dev_start
