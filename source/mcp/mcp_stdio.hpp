#ifndef RNMCPS_MCP_STDIO_HPP
#define RNMCPS_MCP_STDIO_HPP

// MCP stdio transport: reading JSON messages from stdin and writing to stdout.

#include <iostream>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input = std::cin);

// Write a JSON message followed by a newline, then flush.
void write_message(const std::string &json_string, std::ostream &output = std::cout);

// Write a log line to stderr, serialized with protocol output.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // RNMCPS_MCP_STDIO_HPP
