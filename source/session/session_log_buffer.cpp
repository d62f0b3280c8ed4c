#include "session/session_log_buffer.hpp"
#include "logs/log_classifier.hpp"
#include "utils/line_sanitize.hpp"

#include <algorithm>

namespace session_log_buffer {

const LogEntry &append_line(LogBuffer &buffer, const std::string &raw_line, int64_t timestamp_ms) {
    LogEntry entry;
    entry.timestamp_ms = timestamp_ms;
    entry.raw = line_sanitize::sanitize_utf8(raw_line);
    entry.message = line_sanitize::to_message(entry.raw);
    entry.level = log_classifier::classify_level(entry.message);
    append_entry(buffer, std::move(entry));
    return buffer.entries.back();
}

void append_entry(LogBuffer &buffer, LogEntry entry) {
    std::size_t capacity = std::max<std::size_t>(buffer.capacity, 1);
    while (buffer.entries.size() >= capacity) {
        buffer.entries.pop_front();
    }
    buffer.entries.push_back(std::move(entry));
    buffer.total_appended++;
}

std::vector<LogEntry> tail_entries(const LogBuffer &buffer, std::size_t tail) {
    std::size_t count = buffer.entries.size();
    if (tail != 0 && tail < count) {
        count = tail;
    }
    return std::vector<LogEntry>(buffer.entries.end() - static_cast<std::ptrdiff_t>(count),
                                 buffer.entries.end());
}

std::vector<std::string> feed(LineAssembler &assembler, const char *data, std::size_t length) {
    std::vector<std::string> lines;
    for (std::size_t index = 0; index < length; ++index) {
        char character = data[index];
        if (character == '\n') {
            if (assembler.last_was_carriage_return) {
                // Second half of "\r\n": the line was already emitted.
                assembler.last_was_carriage_return = false;
                continue;
            }
            lines.push_back(std::move(assembler.pending));
            assembler.pending.clear();
            continue;
        }
        if (character == '\r') {
            lines.push_back(std::move(assembler.pending));
            assembler.pending.clear();
            assembler.last_was_carriage_return = true;
            continue;
        }
        assembler.last_was_carriage_return = false;
        assembler.pending += character;
        if (assembler.pending.size() >= kMaxPendingLineBytes) {
            lines.push_back(std::move(assembler.pending));
            assembler.pending.clear();
        }
    }
    return lines;
}

std::string flush(LineAssembler &assembler) {
    std::string remainder = std::move(assembler.pending);
    assembler.pending.clear();
    assembler.last_was_carriage_return = false;
    return remainder;
}

bool is_blank(const std::string &line) {
    return line_sanitize::to_message(line).empty();
}

} // namespace session_log_buffer
