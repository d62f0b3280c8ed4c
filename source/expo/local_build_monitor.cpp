#include "expo/local_build_monitor.hpp"
#include "session/session_supervisor.hpp"
#include "utils/debug_log.hpp"

namespace local_build_monitor {

std::string verdict_to_string(BuildVerdict verdict) {
    switch (verdict) {
    case BuildVerdict::Building:
        return "building";
    case BuildVerdict::Success:
        return "success";
    case BuildVerdict::Failed:
        return "failed";
    case BuildVerdict::Cancelled:
        return "cancelled";
    }
    return "building";
}

BuildVerdict derive_verdict(const log_classifier::BuildCompletion &completion,
                            session_types::SessionStatus status) {
    if (completion.complete) {
        return completion.success.value_or(false) ? BuildVerdict::Success : BuildVerdict::Failed;
    }
    if (status == session_types::SessionStatus::Stopped) {
        return BuildVerdict::Cancelled;
    }
    return BuildVerdict::Building;
}

BuildReadResult read_build(const std::string &session_id, std::size_t tail) {
    BuildReadResult result;

    session_supervisor::ReadOutputResult output = session_supervisor::read_output(session_id, tail);
    if (!output.success) {
        debug_log::log("read_build " + session_id + " failed: " + output.error_message);
        result.error_kind = output.error_kind;
        result.error_message = output.error_message.empty() ? "Failed to read logs" : output.error_message;
        return result;
    }

    result.logs.reserve(output.logs.size());
    for (const auto &entry : output.logs) {
        result.logs.push_back(entry.raw);
    }

    log_classifier::BuildCompletion completion = log_classifier::is_build_complete(result.logs);
    result.verdict = derive_verdict(completion, output.status);
    result.session_status = output.status;
    result.errors = log_classifier::extract_errors(result.logs);

    for (const auto &line : result.logs) {
        auto progress = log_classifier::extract_build_progress(line);
        if (!progress) {
            continue;
        }
        if (!progress->stage.empty()) {
            result.stage = progress->stage;
        }
        if (progress->percentage) {
            result.progress = progress->percentage;
        }
    }

    debug_log::log("read_build " + session_id + ": " + verdict_to_string(result.verdict) + ", " +
                   std::to_string(result.logs.size()) + " lines, " + std::to_string(result.errors.size()) +
                   " errors");
    result.success = true;
    return result;
}

} // namespace local_build_monitor
