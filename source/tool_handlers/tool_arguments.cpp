#include "tool_handlers/tool_arguments.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tool_arguments {

static std::string join_allowed(const std::vector<std::string> &allowed) {
    std::string joined;
    for (const auto &name : allowed) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

bool read_string(const json &arguments, const std::string &key, std::string &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_string()) {
        error = "Parameter '" + key + "' must be a string.";
        return false;
    }
    value = arguments[key].get<std::string>();
    return true;
}

bool read_bool(const json &arguments, const std::string &key, bool &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_boolean()) {
        error = "Parameter '" + key + "' must be a boolean.";
        return false;
    }
    value = arguments[key].get<bool>();
    return true;
}

bool read_integer(const json &arguments, const std::string &key, long long &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    const json &item = arguments[key];
    if (item.is_number_integer()) {
        value = item.get<long long>();
        return true;
    }
    // Clients often send 50.0 for 50. The cast is only defined inside the
    // long long range; 2^63 itself is already out of it.
    if (item.is_number_float()) {
        double number = item.get<double>();
        if (std::isfinite(number) && number >= static_cast<double>(std::numeric_limits<long long>::min()) &&
            number < 9223372036854775808.0 &&
            number == static_cast<double>(static_cast<long long>(number))) {
            value = static_cast<long long>(number);
            return true;
        }
    }
    error = "Parameter '" + key + "' must be an integer.";
    return false;
}

bool require_string(const json &arguments, const std::string &key, std::string &value, std::string &error) {
    if (!arguments.contains(key) || !arguments[key].is_string() || arguments[key].get<std::string>().empty()) {
        error = "Missing required parameter '" + key + "' (string).";
        return false;
    }
    value = arguments[key].get<std::string>();
    return true;
}

bool read_enum(const json &arguments, const std::string &key, const std::vector<std::string> &allowed,
               std::string &value, std::string &error) {
    std::string candidate = value;
    if (!read_string(arguments, key, candidate, error)) {
        return false;
    }
    if (std::find(allowed.begin(), allowed.end(), candidate) == allowed.end()) {
        error = "Parameter '" + key + "' must be one of: " + join_allowed(allowed) + ".";
        return false;
    }
    value = candidate;
    return true;
}

json enum_property(const std::vector<std::string> &allowed, const std::string &description) {
    json property;
    property["type"] = "string";
    property["enum"] = allowed;
    property["description"] = description;
    return property;
}

} // namespace tool_arguments
