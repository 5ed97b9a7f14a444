#include "../../include/core/agent_controller.hpp"

namespace chartagent::core {

AgentController::AgentController(TradingCycle& cycle, ITimer& timer, uint32_t interval_ms, int32_t failure_threshold,
                                 state::StateStore* store, logging::AsyncLogger* logger)
    : cycle_(cycle), timer_(timer), interval_ms_(interval_ms), store_(store), logger_(logger),
      breaker_(failure_threshold) {}

AgentController::~AgentController() {
    timer_.cancel();
    timer_.wait();
}

void AgentController::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.state != AgentState::Idle) return;

        if (breaker_.is_halted()) {
            breaker_.reset();
        }
        resume_on_restart_ = false;
        status_.state = AgentState::Running;
        status_.halted = false;
        status_.halt_reason.clear();
        status_.consecutive_error_count = breaker_.consecutive_errors();
        persist_locked();
    }

    CA_LOGF(logger_, Info, System, "Agent started, interval %u ms", interval_ms_);

    run_cycle();

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_.state == AgentState::Running) {
        timer_.arm(interval_ms_, [this]() { on_tick(); });
    }
}

void AgentController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_.state == AgentState::Idle) return;

    timer_.cancel();

    if (in_flight_.load()) {
        status_.state = AgentState::Stopping;
        CA_LOGF(logger_, Info, System, "Stop requested, waiting for in-flight cycle");
        return; // run_cycle() finishes the transition and persists
    }

    status_.state = AgentState::Idle;
    persist_locked();
    CA_LOGF(logger_, Info, System, "Agent stopped");
}

void AgentController::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_on_restart_ = status_.state != AgentState::Idle;
    }
    stop();
}

bool AgentController::resume() {
    if (!store_) return false;

    auto loaded = store_->load();
    if (loaded.status != state::LoadStatus::Loaded) {
        CA_LOGF(logger_, Info, System, "No previous state (%s)", state::load_status_to_string(loaded.status));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.state != AgentState::Idle) return false;

        cycle_.tracker().restore(loaded.state.history);
        breaker_.restore(loaded.state.consecutive_errors);
        status_.consecutive_error_count = breaker_.consecutive_errors();
        status_.performance = cycle_.tracker().snapshot();
    }

    CA_LOGF(logger_, Info, System, "Restored %zu trades, %d consecutive errors", loaded.state.history.size(),
            loaded.state.consecutive_errors);

    if (!loaded.state.running) return false;

    start();
    return true;
}

void AgentController::on_tick() { run_cycle(); }

void AgentController::run_cycle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.state != AgentState::Running) return;

        bool expected = false;
        if (!in_flight_.compare_exchange_strong(expected, true)) {
            ++status_.cycles_skipped;
            CA_LOGF(logger_, Debug, System, "Tick skipped: cycle in flight");
            return;
        }
    }

    CycleReport report = cycle_.run();

    ServiceError alert_error;
    std::string alert_message;
    bool raise_alert = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        ++status_.cycles_run;
        status_.last_outcome = report.outcome;

        if (report.outcome == CycleOutcome::Failed) {
            status_.last_error = report.error.message;
            auto verdict = breaker_.on_failure(report.error);

            if (verdict == safety::BreakerVerdict::Halt) {
                timer_.cancel();
                status_.state = AgentState::Idle;
                status_.halted = true;

                alert_error = report.error;
                if (report.error.is_fatal()) {
                    alert_message = std::string("Critical error (") + error_category_to_string(report.error.category) +
                                    "): " + report.error.message;
                } else {
                    alert_message = "Trading stopped after " + std::to_string(breaker_.consecutive_errors()) +
                                    " consecutive errors: " + report.error.message;
                }
                status_.halt_reason = alert_message;
                raise_alert = true;
            }
        } else {
            breaker_.on_success();
        }

        status_.consecutive_error_count = breaker_.consecutive_errors();
        status_.total_errors = breaker_.total_errors();
        status_.performance = cycle_.tracker().snapshot();

        in_flight_.store(false);
        if (status_.state == AgentState::Stopping) {
            status_.state = AgentState::Idle;
            CA_LOGF(logger_, Info, System, "Agent stopped after in-flight cycle");
        }

        persist_locked();
    }

    if (raise_alert) {
        CA_LOGF(logger_, Fatal, System, "%s", alert_message.c_str());
        if (alert_callback_) {
            alert_callback_(alert_error, alert_message);
        }
    }
}

AgentStatus AgentController::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

AgentState AgentController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.state;
}

void AgentController::persist_locked() {
    if (!store_) return;

    state::PersistedState persisted;
    persisted.running = status_.state != AgentState::Idle || resume_on_restart_;
    persisted.consecutive_errors = breaker_.consecutive_errors();
    persisted.history = cycle_.tracker().history();
    persisted.performance = cycle_.tracker().snapshot();

    if (!store_->save(persisted)) {
        CA_LOGF(logger_, Error, System, "Failed to persist agent state");
    }
}

} // namespace chartagent::core
