#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    auto existing = std::find_if(registered_tools.begin(), registered_tools.end(),
                                 [&definition](const ToolDefinition &tool) { return tool.name == definition.name; });
    if (existing != registered_tools.end()) {
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    for (const auto &tool : registered_tools) {
        if (tool.name != tool_name) {
            continue;
        }
        debug_log::log(tool_name + " invoked");
        try {
            return tool.handler(arguments);
        } catch (const json::exception &error) {
            debug_log::warn(tool_name + ": " + error.what());
            return error_result("Invalid arguments for " + tool_name + ": " + error.what());
        }
    }

    return error_result("Unknown tool: " + tool_name);
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

void clear_registry() {
    registered_tools.clear();
}

json text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json error_result(const std::string &text) {
    return text_result(text, true);
}

json json_result(const json &payload) {
    return text_result(payload.dump(2, ' ', false, json::error_handler_t::replace));
}

} // namespace mcp_tools
