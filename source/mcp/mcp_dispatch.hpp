#ifndef RNMCPS_MCP_DISPATCH_HPP
#define RNMCPS_MCP_DISPATCH_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message);

// Parse raw text and dispatch it. Unparseable text yields a parse error
// response; notifications yield null.
json handle_raw_message(const std::string &raw_message);

} // namespace mcp_dispatch

#endif // RNMCPS_MCP_DISPATCH_HPP
