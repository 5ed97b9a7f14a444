#pragma once

/**
 * AgentController - lifecycle of the periodic trading loop
 *
 * State machine:
 *
 *   Idle --start()--> Running --stop()--> Idle
 *                        |                 ^
 *                        | stop() while    | in-flight cycle
 *                        v  cycle runs     | returns
 *                     Stopping ------------+
 *
 *   Running --breaker Halt--> Idle (+ alert)
 *
 * At most one cycle is in flight. A timer tick that lands while a cycle
 * runs is skipped and counted, never queued. All status fields are
 * published under a mutex; status() returns a copy.
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../safety/circuit_breaker.hpp"
#include "../state/state_store.hpp"
#include "timer.hpp"
#include "trading_cycle.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace chartagent {
namespace core {

enum class AgentState : uint8_t { Idle = 0, Running, Stopping };

inline const char* agent_state_to_string(AgentState state) {
    switch (state) {
        case AgentState::Idle: return "idle";
        case AgentState::Running: return "running";
        case AgentState::Stopping: return "stopping";
        default: return "unknown";
    }
}

struct AgentStatus {
    AgentState state = AgentState::Idle;
    int32_t consecutive_error_count = 0;
    uint64_t total_errors = 0;
    uint64_t cycles_run = 0;
    uint64_t cycles_skipped = 0; // Ticks dropped because a cycle was in flight
    CycleOutcome last_outcome = CycleOutcome::None;
    std::string last_error;
    bool halted = false;
    std::string halt_reason;
    PerformanceSnapshot performance;
};

// Terminal notification; delivery is the callee's business
using AlertCallback = std::function<void(const ServiceError& error, const std::string& message)>;

class AgentController {
public:
    AgentController(TradingCycle& cycle, ITimer& timer,
                    uint32_t interval_ms = config::scheduling::POLLING_INTERVAL_MS,
                    int32_t failure_threshold = config::breaker::FAILURE_THRESHOLD,
                    state::StateStore* store = nullptr, logging::AsyncLogger* logger = nullptr);

    // Cancels the timer and joins its thread, so no tick outlives this
    ~AgentController();

    AgentController(const AgentController&) = delete;
    AgentController& operator=(const AgentController&) = delete;

    /**
     * Idle -> Running: runs one cycle immediately, then arms the timer.
     * No-op unless Idle.
     */
    void start();

    /**
     * Running -> Idle, or Running -> Stopping while a cycle is in flight.
     * Never aborts the in-flight cycle. No-op when Idle.
     */
    void stop();

    /**
     * Process exit: stop() but keep the persisted running flag so the next
     * process resumes the loop.
     */
    void shutdown();

    /**
     * Load persisted history and error count; start() if the agent was
     * running when the state was saved.
     * @return true if the loop was restarted
     */
    bool resume();

    // Timer entry point
    void on_tick();

    AgentStatus status() const;
    AgentState state() const;

    void set_alert_callback(AlertCallback cb) { alert_callback_ = std::move(cb); }

    const safety::CircuitBreaker& breaker() const { return breaker_; }

private:
    TradingCycle& cycle_;
    ITimer& timer_;
    uint32_t interval_ms_;
    state::StateStore* store_;
    logging::AsyncLogger* logger_;

    safety::CircuitBreaker breaker_;
    AlertCallback alert_callback_;

    mutable std::mutex mutex_;
    AgentStatus status_;
    std::atomic<bool> in_flight_{false};
    bool resume_on_restart_ = false;

    void run_cycle();
    void persist_locked();
};

} // namespace core
} // namespace chartagent
