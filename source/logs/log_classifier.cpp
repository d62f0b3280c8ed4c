#include "logs/log_classifier.hpp"
#include "platform/platform_abi.hpp"
#include "utils/line_sanitize.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace log_classifier {

namespace {

// Literal markers.
const char kBundlingCompletePhrase[] = "Bundling complete";
const char kIosBuildSucceeded[] = "BUILD SUCCEEDED";
const char kIosBuildFailed[] = "BUILD FAILED";
const char kAndroidBuildSuccessful[] = "BUILD SUCCESSFUL";
// Gradle prints the same phrase as xcodebuild on failure; the Android failure
// branch below can therefore never be reached.
const char kAndroidBuildFailed[] = "BUILD FAILED";

const std::vector<std::string> &ready_phrases() {
    static const std::vector<std::string> phrases = {
        "Logs for your project",
        "Waiting on http://",
    };
    return phrases;
}

const std::regex &ready_pattern() {
    static const std::regex pattern("Metro.*waiting on");
    return pattern;
}

const std::regex &bundling_pattern() {
    static const std::regex pattern("Bundling \\d+.\\d+%");
    return pattern;
}

const std::regex &metro_progress_pattern() {
    static const std::regex pattern("Bundling\\s+(\\d+\\.\\d+)%");
    return pattern;
}

const std::regex &expo_url_pattern() {
    static const std::regex pattern("exp://[^\\s]+");
    return pattern;
}

const std::regex &metro_url_pattern() {
    static const std::regex pattern("http://[^\\s]+");
    return pattern;
}

const std::regex &xcode_progress_pattern() {
    static const std::regex pattern("\xE2\x96\xB8\\s*(.*)"); // "▸"
    return pattern;
}

const std::regex &gradle_task_pattern() {
    static const std::regex pattern(">\\s*Task\\s+(\\S+)");
    return pattern;
}

const std::regex &bracket_progress_pattern() {
    static const std::regex pattern("\\[(\\d+)/(\\d+)\\]");
    return pattern;
}

const std::regex &port_pattern() {
    static const std::regex pattern(":(\\d+)");
    return pattern;
}

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool contains(const std::string &text, const char *needle) {
    return text.find(needle) != std::string::npos;
}

bool matches_error(const std::string &line) {
    std::string lower = to_lower(line);
    return contains(lower, "error") || contains(lower, "fatal");
}

bool matches_warning(const std::string &line) {
    return contains(to_lower(line), "warn");
}

// The last `window` lines joined with '\n'.
std::string join_recent(const std::vector<std::string> &lines, std::size_t window) {
    std::size_t start = lines.size() > window ? lines.size() - window : 0;
    std::string joined;
    for (std::size_t index = start; index < lines.size(); ++index) {
        if (index != start) {
            joined += '\n';
        }
        joined += lines[index];
    }
    return joined;
}

} // namespace

std::string type_to_string(LogType type) {
    switch (type) {
    case LogType::Metro:
        return "metro";
    case LogType::Native:
        return "native";
    case LogType::Expo:
        return "expo";
    case LogType::Generic:
        return "generic";
    }
    return "generic";
}

std::string url_type_to_string(UrlType type) {
    return type == UrlType::Expo ? "expo" : "metro";
}

LogType classify_type(const std::string &line) {
    if (contains(line, "Metro") || contains(line, "Bundling")) {
        return LogType::Metro;
    }
    if (contains(line, "Xcode") || contains(line, "Gradle") || contains(line, "\xE2\x96\xB8")) {
        return LogType::Native;
    }
    if (contains(line, "Expo") || contains(line, "exp://")) {
        return LogType::Expo;
    }
    return LogType::Generic;
}

LogLevel classify_level(const std::string &line) {
    if (matches_error(line)) {
        return LogLevel::Error;
    }
    if (matches_warning(line)) {
        return LogLevel::Warn;
    }
    if (contains(to_lower(line), "debug")) {
        return LogLevel::Debug;
    }
    return LogLevel::Info;
}

std::vector<ExtractedUrl> extract_urls(const std::string &line) {
    std::vector<ExtractedUrl> urls;
    std::unordered_set<std::string> seen;

    auto collect = [&](const std::regex &pattern, UrlType type) {
        for (std::sregex_iterator iterator(line.begin(), line.end(), pattern), end; iterator != end; ++iterator) {
            std::string url = iterator->str();
            if (seen.insert(url).second) {
                ExtractedUrl extracted;
                extracted.url = url;
                extracted.type = type;
                extracted.qr_compatible = true;
                urls.push_back(extracted);
            }
        }
    };

    collect(expo_url_pattern(), UrlType::Expo);
    collect(metro_url_pattern(), UrlType::Metro);
    return urls;
}

std::optional<MetroProgress> extract_metro_progress(const std::string &line) {
    std::smatch match;
    if (std::regex_search(line, match, metro_progress_pattern())) {
        double percentage = std::strtod(match[1].str().c_str(), nullptr);
        MetroProgress progress;
        progress.completed = percentage;
        progress.total = 100.0;
        progress.percentage = percentage;
        progress.message = line_sanitize::trim(line);
        return progress;
    }

    if (contains(line, kBundlingCompletePhrase)) {
        MetroProgress progress;
        progress.completed = 100.0;
        progress.total = 100.0;
        progress.percentage = 100.0;
        progress.message = "Bundling complete";
        return progress;
    }

    return std::nullopt;
}

std::optional<BuildProgress> extract_build_progress(const std::string &line) {
    std::smatch match;

    if (std::regex_search(line, match, xcode_progress_pattern())) {
        BuildProgress progress;
        progress.stage = line_sanitize::trim(match[1].str());
        if (progress.stage.empty()) {
            progress.stage = "Building";
        }
        progress.message = line_sanitize::trim(line);
        return progress;
    }

    if (std::regex_search(line, match, gradle_task_pattern())) {
        // ":app:compileDebugJavaWithJavac" -> "compileDebugJavaWithJavac"
        std::string task_path = match[1].str();
        std::size_t last_colon = task_path.rfind(':');
        BuildProgress progress;
        progress.stage = (last_colon == std::string::npos) ? task_path : task_path.substr(last_colon + 1);
        if (progress.stage.empty()) {
            progress.stage = "Building";
        }
        progress.message = line_sanitize::trim(line);
        return progress;
    }

    if (std::regex_search(line, match, bracket_progress_pattern())) {
        double completed = std::strtod(match[1].str().c_str(), nullptr);
        double total = std::strtod(match[2].str().c_str(), nullptr);
        BuildProgress progress;
        progress.stage = "Building";
        if (total > 0.0) {
            progress.percentage = static_cast<int>(std::lround(completed / total * 100.0));
        }
        progress.message = line_sanitize::trim(line);
        return progress;
    }

    return std::nullopt;
}

bool is_dev_server_ready(const std::vector<std::string> &lines) {
    std::string recent = join_recent(lines, kReadyWindowLines);
    if (std::regex_search(recent, ready_pattern())) {
        return true;
    }
    for (const auto &phrase : ready_phrases()) {
        if (recent.find(phrase) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool is_bundling(const std::vector<std::string> &lines) {
    return std::regex_search(join_recent(lines, kBundlingWindowLines), bundling_pattern());
}

BuildCompletion is_build_complete(const std::vector<std::string> &lines) {
    std::string recent = join_recent(lines, kBuildCompleteWindowLines);
    BuildCompletion completion;

    if (contains(recent, kIosBuildSucceeded)) {
        completion.complete = true;
        completion.success = true;
        completion.message = "iOS build completed successfully";
        return completion;
    }
    if (contains(recent, kIosBuildFailed)) {
        completion.complete = true;
        completion.success = false;
        completion.message = "iOS build failed";
        return completion;
    }
    if (contains(recent, kAndroidBuildSuccessful)) {
        completion.complete = true;
        completion.success = true;
        completion.message = "Android build completed successfully";
        return completion;
    }
    if (contains(recent, kAndroidBuildFailed)) {
        completion.complete = true;
        completion.success = false;
        completion.message = "Android build failed";
        return completion;
    }
    return completion;
}

std::vector<std::string> extract_errors(const std::vector<std::string> &lines) {
    std::vector<std::string> errors;
    for (const auto &line : lines) {
        if (matches_error(line)) {
            errors.push_back(line_sanitize::trim(line));
        }
    }
    return errors;
}

std::vector<std::string> extract_warnings(const std::vector<std::string> &lines) {
    std::vector<std::string> warnings;
    for (const auto &line : lines) {
        if (matches_warning(line)) {
            warnings.push_back(line_sanitize::trim(line));
        }
    }
    return warnings;
}

LogSummary summarize(const std::vector<std::string> &lines) {
    LogSummary summary;
    summary.total = lines.size();
    summary.errors = extract_errors(lines).size();
    summary.warnings = extract_warnings(lines).size();

    std::unordered_set<std::string> seen;
    for (const auto &line : lines) {
        for (const auto &extracted : extract_urls(line)) {
            if (seen.insert(extracted.url).second) {
                summary.urls.push_back(extracted.url);
            }
        }
    }

    for (auto iterator = lines.rbegin(); iterator != lines.rend(); ++iterator) {
        std::optional<MetroProgress> progress = extract_metro_progress(*iterator);
        if (progress) {
            summary.progress = progress->percentage;
            break;
        }
    }

    return summary;
}

ParsedLog parse_line(const std::string &line) {
    ParsedLog parsed;
    parsed.timestamp_ms = platform::now_epoch_milliseconds();
    parsed.level = classify_level(line);
    parsed.type = classify_type(line);
    parsed.message = line_sanitize::trim(line);
    parsed.urls = extract_urls(line);
    if (parsed.type == LogType::Metro) {
        parsed.metro_progress = extract_metro_progress(line);
    }
    if (parsed.type == LogType::Native) {
        parsed.build_progress = extract_build_progress(line);
    }
    return parsed;
}

std::vector<ParsedLog> parse_lines(const std::vector<std::string> &lines) {
    std::vector<ParsedLog> parsed;
    parsed.reserve(lines.size());
    for (const auto &line : lines) {
        parsed.push_back(parse_line(line));
    }
    return parsed;
}

std::string format_logs(const std::vector<ParsedLog> &parsed_logs) {
    std::ostringstream output;
    bool first = true;
    for (const auto &parsed : parsed_logs) {
        std::time_t seconds = static_cast<std::time_t>(parsed.timestamp_ms / 1000);
        std::tm utc_time{};
        gmtime_r(&seconds, &utc_time);
        char clock_text[16];
        std::snprintf(clock_text, sizeof(clock_text), "%02d:%02d:%02d",
                      utc_time.tm_hour, utc_time.tm_min, utc_time.tm_sec);

        std::string level = session_types::level_to_string(parsed.level);
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
        level.resize(5, ' ');

        if (!first) {
            output << '\n';
        }
        first = false;
        output << '[' << clock_text << "] " << level << ' ' << parsed.message;
    }
    return output.str();
}

std::optional<std::string> extract_url(const std::string &line) {
    static const std::regex expo_pattern("exp://[\\d.]+:\\d+");
    static const std::regex http_pattern("http://[\\d.]+:\\d+");
    static const std::regex localhost_pattern("http://localhost:\\d+");

    std::smatch match;
    for (const std::regex *pattern : {&expo_pattern, &http_pattern, &localhost_pattern}) {
        if (std::regex_search(line, match, *pattern)) {
            return match.str();
        }
    }
    return std::nullopt;
}

std::optional<int> extract_port(const std::string &url) {
    std::smatch match;
    if (!std::regex_search(url, match, port_pattern())) {
        return std::nullopt;
    }
    long value = std::strtol(match[1].str().c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

} // namespace log_classifier
