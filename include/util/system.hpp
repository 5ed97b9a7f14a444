#pragma once

/**
 * System utilities for the chart agent
 *
 * Signal handling for graceful shutdown of the agent process.
 */

#include <atomic>
#include <csignal>
#include <iostream>

namespace chartagent {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline void (*g_pre_shutdown_callback)() = nullptr;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Sets running flag to false and optionally calls pre-shutdown callback.
 * Installed via install_shutdown_handler().
 */
inline void graceful_shutdown_handler(int sig) {
    if (detail::g_pre_shutdown_callback) {
        detail::g_pre_shutdown_callback();
    }
    std::cout << "\n\n[SHUTDOWN] Received signal " << sig << ", stopping gracefully...\n";
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * The main loop owns the agent and persists state after it sees the flag
 * drop, so the callback must stay async-signal-safe.
 *
 * @param running Atomic flag to set to false on signal
 * @param pre_shutdown Optional callback to invoke before setting flag
 */
inline void install_shutdown_handler(std::atomic<bool>& running, void (*pre_shutdown)() = nullptr) {
    detail::g_running_flag = &running;
    detail::g_pre_shutdown_callback = pre_shutdown;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

} // namespace util
} // namespace chartagent
