#include "utils/line_sanitize.hpp"

#include <cstdint>

namespace line_sanitize {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

constexpr char kEscape = '\x1b';
constexpr char kBell = '\x07';

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

bool is_space(char character) {
    return character == ' ' || character == '\t' || character == '\n' ||
           character == '\r' || character == '\f' || character == '\v';
}

// Length of the escape sequence starting at text[position] (which is ESC).
size_t escape_sequence_length(const std::string &text, size_t position) {
    size_t index = position + 1;
    if (index >= text.size()) {
        return 1;
    }

    char introducer = text[index];
    if (introducer == '[') {
        // CSI: parameters and intermediates, terminated by a byte in 0x40..0x7E.
        ++index;
        while (index < text.size()) {
            unsigned char byte = static_cast<unsigned char>(text[index]);
            ++index;
            if (byte >= 0x40u && byte <= 0x7Eu) {
                break;
            }
        }
        return index - position;
    }

    if (introducer == ']') {
        // OSC: terminated by BEL or ESC backslash.
        ++index;
        while (index < text.size()) {
            if (text[index] == kBell) {
                return index + 1 - position;
            }
            if (text[index] == kEscape && index + 1 < text.size() && text[index + 1] == '\\') {
                return index + 2 - position;
            }
            ++index;
        }
        return index - position;
    }

    return 2;
}

} // namespace

void sanitize_utf8(std::string &text) {
    std::string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        unsigned char lead = *pointer;
        unsigned char length = utf8_lead_length(lead);

        if (length == 0 || pointer + length > end) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }

        bool valid = true;
        for (unsigned char index = 1; index < length; ++index) {
            if (!is_continuation(pointer[index])) {
                valid = false;
                break;
            }
        }

        if (!valid) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }

        result.append(reinterpret_cast<const char *>(pointer), static_cast<size_t>(length));
        pointer += length;
    }

    text = std::move(result);
}

std::string sanitize_utf8(const std::string &text) {
    std::string copy = text;
    sanitize_utf8(copy);
    return copy;
}

std::string strip_ansi_escapes(const std::string &text) {
    if (text.find(kEscape) == std::string::npos) {
        return text;
    }

    std::string result;
    result.reserve(text.size());
    size_t position = 0;
    while (position < text.size()) {
        if (text[position] == kEscape) {
            position += escape_sequence_length(text, position);
            continue;
        }
        result += text[position];
        ++position;
    }
    return result;
}

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_message(const std::string &raw_line) {
    return trim(strip_ansi_escapes(raw_line));
}

} // namespace line_sanitize
