#ifndef RNMCPS_LOG_CLASSIFIER_HPP
#define RNMCPS_LOG_CLASSIFIER_HPP

// Log classifier for bundler, dev-server and native build output.
// Every function is a pure function of its arguments; there is no state to
// initialize and the functions may be called from any thread.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "session/session_types.hpp"

namespace log_classifier {

using session_types::LogLevel;

enum class LogType {
    Metro,
    Native,
    Expo,
    Generic
};

enum class UrlType {
    Expo,   // exp:// local-network dev server URL
    Metro   // http:// bundler URL
};

struct ExtractedUrl {
    std::string url;
    UrlType type = UrlType::Expo;
    bool qr_compatible = true;
};

struct MetroProgress {
    double completed = 0.0;
    double total = 100.0;
    double percentage = 0.0;
    std::string message;
};

struct BuildProgress {
    std::string stage;
    std::optional<int> percentage;
    std::string message;
};

struct BuildCompletion {
    bool complete = false;
    std::optional<bool> success;
    std::string message;
};

struct LogSummary {
    std::size_t total = 0;
    std::size_t errors = 0;
    std::size_t warnings = 0;
    std::vector<std::string> urls; // unique, first-seen order
    std::optional<double> progress; // latest bundling percentage
};

struct ParsedLog {
    LogType type = LogType::Generic;
    LogLevel level = LogLevel::Info;
    std::string message;
    int64_t timestamp_ms = 0;
    std::vector<ExtractedUrl> urls;
    std::optional<MetroProgress> metro_progress;   // metro lines only
    std::optional<BuildProgress> build_progress;   // native lines only
};

// Window sizes for the multi-line checks.
constexpr std::size_t kReadyWindowLines = 20;
constexpr std::size_t kBundlingWindowLines = 10;
constexpr std::size_t kBuildCompleteWindowLines = 20;

std::string type_to_string(LogType type);
std::string url_type_to_string(UrlType type);

// metro > native > expo > generic, first matching family wins.
LogType classify_type(const std::string &line);

// error > warn > debug > info (case-insensitive).
LogLevel classify_level(const std::string &line);

// exp:// URLs first, then http:// URLs; duplicates within the line dropped.
std::vector<ExtractedUrl> extract_urls(const std::string &line);

// "Bundling NN.N%" or the bundling-complete phrase (percentage 100).
std::optional<MetroProgress> extract_metro_progress(const std::string &line);

// "▸ <stage>", then "> Task :module:task", then "[i/n]".
std::optional<BuildProgress> extract_build_progress(const std::string &line);

// A ready marker within the last kReadyWindowLines lines.
bool is_dev_server_ready(const std::vector<std::string> &lines);

// A bundling percentage within the last kBundlingWindowLines lines.
bool is_bundling(const std::vector<std::string> &lines);

// Scans the last kBuildCompleteWindowLines lines. Check order is iOS success,
// iOS failure, Android success, Android failure; first match wins.
BuildCompletion is_build_complete(const std::vector<std::string> &lines);

// Lines matching the error (warning) pattern, trimmed, in input order.
std::vector<std::string> extract_errors(const std::vector<std::string> &lines);
std::vector<std::string> extract_warnings(const std::vector<std::string> &lines);

LogSummary summarize(const std::vector<std::string> &lines);

ParsedLog parse_line(const std::string &line);
std::vector<ParsedLog> parse_lines(const std::vector<std::string> &lines);

// "[HH:MM:SS] LEVEL message" per entry (UTC), joined with '\n'.
std::string format_logs(const std::vector<ParsedLog> &parsed_logs);

// The dev-server URL of a line: exp://<ip>:<port>, else http://<ip>:<port>,
// else http://localhost:<port>.
std::optional<std::string> extract_url(const std::string &line);

// First ":<digits>" in the URL.
std::optional<int> extract_port(const std::string &url);

} // namespace log_classifier

#endif // RNMCPS_LOG_CLASSIFIER_HPP
