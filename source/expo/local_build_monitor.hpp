#ifndef RNMCPS_LOCAL_BUILD_MONITOR_HPP
#define RNMCPS_LOCAL_BUILD_MONITOR_HPP

// On-demand progress verdict for a local native build session. There is no
// polling loop: each read re-runs the build-completion check over the lines
// captured so far.

#include <optional>
#include <string>
#include <vector>

#include "logs/log_classifier.hpp"
#include "session/session_types.hpp"

namespace local_build_monitor {

enum class BuildVerdict {
    Building,
    Success,
    Failed,
    Cancelled
};

std::string verdict_to_string(BuildVerdict verdict);

// complete && success -> Success, complete && !success -> Failed,
// !complete && stopped -> Cancelled, otherwise Building.
BuildVerdict derive_verdict(const log_classifier::BuildCompletion &completion,
                            session_types::SessionStatus status);

struct BuildReadResult {
    bool success = false;
    session_types::ErrorKind error_kind = session_types::ErrorKind::None;
    std::string error_message;
    BuildVerdict verdict = BuildVerdict::Building;
    session_types::SessionStatus session_status = session_types::SessionStatus::Running;
    std::vector<std::string> logs;        // raw lines
    std::optional<int> progress;          // latest native build percentage
    std::string stage;                    // latest native build stage
    std::vector<std::string> errors;
};

BuildReadResult read_build(const std::string &session_id, std::size_t tail);

} // namespace local_build_monitor

#endif // RNMCPS_LOCAL_BUILD_MONITOR_HPP
