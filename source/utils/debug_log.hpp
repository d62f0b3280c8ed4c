#ifndef RNMCPS_DEBUG_LOG_HPP
#define RNMCPS_DEBUG_LOG_HPP

#include <mutex>
#include <string>

namespace debug_log {

// Returns true if RNMCPS_DEBUG env is set to a truthy value (1, true, yes).
// The variable is read once and cached.
bool is_debug_enabled();

// Force debug output on or off (tests, or config loaded from elsewhere).
void set_debug_enabled(bool enabled);

// Writes message to stderr with [rnmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Serializes every line written to stderr, here and in mcp_stdio.
std::mutex &output_mutex();

// Writes a warning line to stderr regardless of the debug switch.
void warn(const std::string &message);

} // namespace debug_log

#endif // RNMCPS_DEBUG_LOG_HPP
