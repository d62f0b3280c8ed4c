#ifndef RNMCPS_MCP_TOOLS_HPP
#define RNMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls, plus
// the builders every handler uses for its result payload.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Register a tool. A second registration under the same name replaces the first.
void register_tool(const ToolDefinition &definition);

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Returns the result payload (content + isError).
// A json exception escaping a handler becomes an isError result.
json dispatch_tool_call(const std::string &tool_name, const json &arguments);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

// Empty the registry (tests).
void clear_registry();

// {content:[{type:"text", text}], isError}
json text_result(const std::string &text, bool is_error = false);
json error_result(const std::string &text);

// Pretty-printed (2-space) JSON as the text content.
json json_result(const json &payload);

} // namespace mcp_tools

#endif // RNMCPS_MCP_TOOLS_HPP
