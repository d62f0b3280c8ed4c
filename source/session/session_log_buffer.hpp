#ifndef RNMCPS_SESSION_LOG_BUFFER_HPP
#define RNMCPS_SESSION_LOG_BUFFER_HPP

// Capacity-bounded log storage for one session, and the line assembler that
// turns raw pipe chunks into lines.

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "session/session_types.hpp"

namespace session_log_buffer {

using session_types::LogEntry;

// Ordered, append-only sequence of entries. Once capacity is reached, each
// append evicts the oldest entry. Not thread-safe; the owner locks.
struct LogBuffer {
    std::size_t capacity = 1000;
    std::deque<LogEntry> entries;
    std::size_t total_appended = 0; // including evicted entries
};

// Classify raw_line and append it. Returns the stored entry.
const LogEntry &append_line(LogBuffer &buffer, const std::string &raw_line, int64_t timestamp_ms);

// Append a pre-built entry (synthetic lines such as the exit notice).
void append_entry(LogBuffer &buffer, LogEntry entry);

// The last `tail` entries in chronological order. tail == 0 returns all.
std::vector<LogEntry> tail_entries(const LogBuffer &buffer, std::size_t tail);

// Splits a byte stream into lines. '\n' and '\r' both terminate a line
// ("\r\n" counts once); an unterminated remainder is held for the next chunk.
// A run of output this long without a terminator is emitted as a line.
constexpr std::size_t kMaxPendingLineBytes = 64 * 1024;

struct LineAssembler {
    std::string pending;
    bool last_was_carriage_return = false;
};

// Feed a chunk; returns the lines it completed (terminators removed).
std::vector<std::string> feed(LineAssembler &assembler, const char *data, std::size_t length);

// End of stream: returns the held remainder (may be empty) and resets.
std::string flush(LineAssembler &assembler);

// Lines that are empty after trimming carry no information and are skipped.
bool is_blank(const std::string &line);

} // namespace session_log_buffer

#endif // RNMCPS_SESSION_LOG_BUFFER_HPP
