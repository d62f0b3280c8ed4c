#include "utils/debug_log.hpp"

#include <atomic>
#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

// -1 = not read yet, 0 = off, 1 = on.
static std::atomic<int> debug_state{-1};


static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool read_debug_environment() {
    const char *value = std::getenv("RNMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    int state = debug_state.load();
    if (state < 0) {
        state = read_debug_environment() ? 1 : 0;
        debug_state.store(state);
    }
    return state == 1;
}

void set_debug_enabled(bool enabled) {
    debug_state.store(enabled ? 1 : 0);
}

// Capture threads and the request loop log concurrently; keep lines whole.
std::mutex &output_mutex() {
    static std::mutex mutex;
    return mutex;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[rnmcps] " << message << std::endl;
}

void warn(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[rnmcps] warning: " << message << std::endl;
}

} // namespace debug_log
