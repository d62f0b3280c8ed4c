#ifndef RNMCPS_LINE_SANITIZE_HPP
#define RNMCPS_LINE_SANITIZE_HPP

// Normalization of captured process output before it is stored or serialized.

#include <string>

namespace line_sanitize {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// In-place version. nlohmann::json refuses to dump invalid UTF-8, so every
// captured line goes through this before it reaches a log buffer.
void sanitize_utf8(std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns a new string.
std::string sanitize_utf8(const std::string &text);

// Removes ANSI escape sequences (CSI "ESC [ ... final", OSC "ESC ] ... BEL/ST",
// and two-byte "ESC x" forms). Bundlers colorize their output.
std::string strip_ansi_escapes(const std::string &text);

// Trims ASCII whitespace from both ends.
std::string trim(const std::string &text);

// strip_ansi_escapes followed by trim: the "message" form of a raw line.
std::string to_message(const std::string &raw_line);

} // namespace line_sanitize

#endif // RNMCPS_LINE_SANITIZE_HPP
