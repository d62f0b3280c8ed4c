// rnmcps – React Native MCP Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries only protocol messages.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>
#include <cstring>

#include "expo/readiness_poller.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "platform/platform_abi.hpp"
#include "session/session_supervisor.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// Without SA_RESTART, a signal interrupts the blocking read on stdin so the
// loop sees the flag instead of waiting for the next message.
static void install_shutdown_handlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int main() {
    std::cerr << "[rnmcps] rnmcps – React Native MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    server_config::ServerConfig config = server_config::load();
    server_config::set_current(config);
    debug_log::set_debug_enabled(config.debug);

    session_supervisor::SupervisorSettings settings;
    settings.default_log_capacity = config.log_capacity;
    settings.kill_grace_milliseconds = config.kill_grace_milliseconds;
    settings.session_retention_milliseconds = config.session_retention_milliseconds;
    settings.default_working_directory = config.project_directory;
    session_supervisor::configure(settings);

    install_shutdown_handlers();
    platform::ignore_broken_pipe_signal();
    tool_handlers::register_all_tools();

    // Wakes an expo_dev_start that is waiting for readiness when a signal arrives.
    readiness_poller::SignalFlagWatcher shutdown_watcher(shutdown_requested, readiness_poller::shutdown_token());

    mcp_stdio::log_message("rnmcps started. Waiting for MCP messages on stdin.");
    if (!config.project_directory.empty()) {
        mcp_stdio::log_message("Project directory: " + config.project_directory);
    }

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            if (shutdown_requested) {
                break;
            }
            // EOF on stdin means the client disconnected.
            debug_log::log("EOF on stdin. Shutting down, will stop all sessions.");
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        json response = mcp_dispatch::handle_raw_message(raw_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    readiness_poller::shutdown_token().cancel();
    debug_log::log("Stopping all sessions and waiting for their capture threads.");
    session_supervisor::shutdown();
    mcp_stdio::log_message("rnmcps shut down.");

    return 0;
}
