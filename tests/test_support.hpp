#ifndef RNMCPS_TEST_SUPPORT_HPP
#define RNMCPS_TEST_SUPPORT_HPP

// Helpers shared by the suites that drive real child processes.

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "session/session_supervisor.hpp"

namespace test_support {

// Poll predicate every 10 ms until it holds or timeout_milliseconds pass.
template <typename Predicate>
bool wait_until(Predicate predicate, int timeout_milliseconds = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

// argv for /bin/sh -c script.
inline std::vector<std::string> shell(const std::string &script) {
    return {"/bin/sh", "-c", script};
}

// True once the capture thread has recorded the exit line.
inline bool has_exited(const std::string &session_id) {
    session_supervisor::ReadOutputResult output = session_supervisor::read_output(session_id, 1);
    if (!output.success || output.logs.empty()) {
        return false;
    }
    const std::string &message = output.logs.back().message;
    return message.rfind("Process exited with code", 0) == 0 || message.rfind("Process killed by signal", 0) == 0;
}

inline bool wait_for_exit(const std::string &session_id, int timeout_milliseconds = 5000) {
    return wait_until([&session_id] { return has_exited(session_id); }, timeout_milliseconds);
}

// Stop and remove a session a test started, ignoring ids that are gone.
inline void discard_session(const std::string &session_id) {
    session_supervisor::stop_session(session_id);
    wait_for_exit(session_id, 10000);
    session_supervisor::remove_session(session_id);
}

} // namespace test_support

#endif // RNMCPS_TEST_SUPPORT_HPP
