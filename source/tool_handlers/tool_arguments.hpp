#ifndef RNMCPS_TOOL_ARGUMENTS_HPP
#define RNMCPS_TOOL_ARGUMENTS_HPP

// Typed access to tools/call arguments. A key that is absent leaves the
// output untouched; a key with the wrong type is an error whose text is
// returned to the caller as an isError result.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tool_arguments {

using json = nlohmann::json;

bool read_string(const json &arguments, const std::string &key, std::string &value, std::string &error);
bool read_bool(const json &arguments, const std::string &key, bool &value, std::string &error);
bool read_integer(const json &arguments, const std::string &key, long long &value, std::string &error);

// Absent or empty is an error.
bool require_string(const json &arguments, const std::string &key, std::string &value, std::string &error);

// String restricted to allowed.
bool read_enum(const json &arguments, const std::string &key, const std::vector<std::string> &allowed,
               std::string &value, std::string &error);

// {"type":"string","enum":[...],"description":...}
json enum_property(const std::vector<std::string> &allowed, const std::string &description);

} // namespace tool_arguments

#endif // RNMCPS_TOOL_ARGUMENTS_HPP
