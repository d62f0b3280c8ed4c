#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "logs/log_classifier.hpp"
#include "session/session_supervisor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "expo_dev_read".
// Returns the tail of a dev server session's log with a classifier summary.

static constexpr long long kDefaultTail = 50;

static json handle_expo_dev_read(const json &arguments) {
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

    session_supervisor::ReadOutputResult output =
        session_supervisor::read_output(session_id, static_cast<std::size_t>(tail));
    if (!output.success) {
        return mcp_tools::error_result(output.error_message.empty() ? "Failed to read logs" : output.error_message);
    }

    json logs = json::array();
    std::vector<std::string> messages;
    messages.reserve(output.logs.size());
    for (const auto &entry : output.logs) {
        json log_entry;
        log_entry["timestamp"] = entry.timestamp_ms;
        log_entry["level"] = session_types::level_to_string(entry.level);
        log_entry["message"] = entry.message;
        logs.push_back(log_entry);
        messages.push_back(entry.message);
    }

    log_classifier::LogSummary summary = log_classifier::summarize(messages);
    json summary_json;
    summary_json["total"] = summary.total;
    summary_json["errors"] = summary.errors;
    summary_json["warnings"] = summary.warnings;
    summary_json["urls"] = summary.urls;
    summary_json["bundling"] = log_classifier::is_bundling(messages);
    if (summary.progress) {
        summary_json["progress"] = *summary.progress;
    }

    json payload;
    payload["logs"] = logs;
    payload["status"] = session_types::status_to_string(output.status);
    payload["total_lines"] = output.logs.size();
    payload["total_captured"] = output.total_captured;
    payload["summary"] = summary_json;
    return mcp_tools::json_result(payload);
}

namespace tool_expo_dev_read {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["session_id"] = {
        {"type", "string"},
        {"description", "Session id returned by expo_dev_start."}
    };
    input_schema["properties"]["tail"] = {
        {"type", "integer"},
        {"default", kDefaultTail},
        {"description", "Number of most recent log lines to return (0 = all retained lines)."}
    };
    input_schema["required"] = json::array({"session_id"});

    mcp_tools::register_tool({
        "expo_dev_read",
        "Read recent logs from an Expo dev server session. Each line has a timestamp (ms epoch), level "
        "(info, warn, error, debug) and message. Also returns the session status and a summary with error "
        "and warning counts, URLs seen and the latest bundling progress.",
        input_schema,
        handle_expo_dev_read
    });
}

} // namespace tool_expo_dev_read
