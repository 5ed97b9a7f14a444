/**
 * chart_agent - Chart-reading forex trading agent
 *
 * Every interval: read the chart screenshot, have the parser label it,
 * turn the labels into indicators, let the oracle decide, size the trade
 * through the risk policy, and execute (paper by default).
 *
 * Usage:
 *   chart_agent --paper --oracle rules --image chart.png
 *   chart_agent -c agent.json                # Resume if previously running
 *   chart_agent --once -v                    # One cycle, debug log
 *   chart_agent -h                           # Help
 */

#include "../include/config/agent_config.hpp"
#include "../include/core/agent_controller.hpp"
#include "../include/core/timer.hpp"
#include "../include/core/trading_cycle.hpp"
#include "../include/execution/paper_trade_executor.hpp"
#include "../include/execution/rest_trade_executor.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/oracle/llm_decision_client.hpp"
#include "../include/oracle/rule_based_oracle.hpp"
#include "../include/perception/omniparser_client.hpp"
#include "../include/perception/perception_source.hpp"
#include "../include/state/state_store.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

using namespace chartagent;
using chartagent::util::CLIArgs;
using chartagent::util::parse_args;
using chartagent::util::print_help;

std::atomic<bool> g_running{true};

namespace {

void apply_cli_overrides(const CLIArgs& args, config::AgentConfig& cfg) {
    if (args.paper_mode) cfg.paper_trading = true;
    if (args.live_mode) cfg.paper_trading = false;
    if (args.interval_ms > 0) cfg.polling_interval_ms = args.interval_ms;
    if (args.lot_size > 0) cfg.lot_size = args.lot_size;
    if (!args.pair.empty()) cfg.instrument = args.pair;
    if (!args.image_path.empty()) cfg.screenshot_path = args.image_path;
}

void print_summary(const core::AgentStatus& status) {
    const auto& p = status.performance;
    std::cout << "\n[DONE] " << status.cycles_run << " cycles (" << status.cycles_skipped << " skipped) | "
              << p.total_trades << " closed trades | win rate " << std::fixed << std::setprecision(1) << p.win_rate
              << "% | P/L " << std::setprecision(2) << (p.cumulative_profit_loss >= 0 ? "+" : "")
              << p.cumulative_profit_loss << " | open " << p.unresolved_trades << "\n";
    if (status.halted) {
        std::cout << "[HALTED] " << status.halt_reason << "\n";
    }
}

} // namespace

int run(const CLIArgs& args) {
    // Configuration
    config::AgentConfig cfg;
    std::string error;
    if (!args.config_path.empty() && !config::load_config_file(args.config_path, cfg, error)) {
        std::cerr << "[ERROR] " << error << "\n";
        return 1;
    }
    config::apply_environment(cfg);
    apply_cli_overrides(args, cfg);

    if (!args.oracle_mode.empty() && !config::oracle_mode_from_string(args.oracle_mode, cfg.oracle_mode)) {
        std::cerr << "[ERROR] Unknown oracle mode: " << args.oracle_mode << "\n";
        return 1;
    }

    auto problems = cfg.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << "[ERROR] " << p << "\n";
        }
        return 1;
    }

    // Logging
    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Info);
    logger.start();

    // Collaborators
    perception::FilePerceptionSource source(cfg.screenshot_path);
    perception::OmniParserClient parser(cfg.parser_url, cfg.service_timeout_ms, &logger);

    std::unique_ptr<oracle::IDecisionOracle> decision_oracle;
    if (cfg.oracle_mode == config::OracleMode::Llm) {
        oracle::LlmClientConfig llm;
        llm.url = cfg.oracle_url;
        llm.model = cfg.oracle_model;
        llm.api_key = cfg.openai_api_key;
        llm.temperature = cfg.oracle_temperature;
        llm.timeout_ms = cfg.service_timeout_ms;
        decision_oracle = std::make_unique<oracle::LlmDecisionClient>(llm, &logger);
    } else {
        decision_oracle = std::make_unique<oracle::RuleBasedOracle>(0.0, &logger);
    }

    std::unique_ptr<execution::ITradeExecutor> executor;
    if (cfg.paper_trading) {
        executor = std::make_unique<execution::PaperTradeExecutor>(cfg.paper_balance, &logger);
    } else {
        executor = std::make_unique<execution::RestTradeExecutor>(cfg.execution_url, cfg.execution_api_key,
                                                                  cfg.service_timeout_ms, &logger);
    }

    core::CycleSettings settings;
    settings.instrument = cfg.instrument;
    settings.lot_size = cfg.lot_size;
    settings.parse_options.box_threshold = cfg.box_threshold;
    settings.parse_options.iou_threshold = cfg.iou_threshold;
    settings.parse_options.normalize_coordinates = cfg.normalize_coordinates;

    core::TradingCycle cycle({&source, &parser, decision_oracle.get(), executor.get()}, settings, {}, &logger);

    state::StateStore store(cfg.state_file, &logger);

    std::unique_ptr<core::ITimer> timer;
    if (args.once) {
        timer = std::make_unique<core::ManualTimer>();
    } else {
        timer = std::make_unique<core::ThreadTimer>();
    }

    core::AgentController agent(cycle, *timer, cfg.polling_interval_ms, cfg.failure_threshold, &store, &logger);
    agent.set_alert_callback([](const ServiceError& err, const std::string& message) {
        std::cerr << "\n[ALERT] " << error_category_to_string(err.category) << ": " << message << "\n";
    });

    std::cout << "[START] " << cfg.instrument << " | " << (cfg.paper_trading ? "PAPER" : "LIVE") << " | oracle "
              << config::oracle_mode_to_string(cfg.oracle_mode) << " | every " << cfg.polling_interval_ms / 1000
              << "s\n";

    if (!agent.resume()) {
        agent.start();
    }

    if (args.once) {
        agent.stop();
    } else {
        auto start = std::chrono::steady_clock::now();
        while (g_running) {
            auto elapsed =
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count();

            if (args.duration > 0 && elapsed >= args.duration) break;

            if (agent.state() == core::AgentState::Idle) {
                break; // Halted by the circuit breaker
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_running) {
            agent.stop(); // Duration reached or halted: do not resume next time
        } else {
            agent.shutdown();
        }

        // Let an in-flight cycle finish before tearing down collaborators
        while (agent.state() != core::AgentState::Idle) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        timer->cancel();
        timer->wait();
    }

    auto status = agent.status();
    print_summary(status);

    if (args.export_history) {
        std::string path = store.export_history(cycle.tracker().history(), cfg.export_directory);
        if (!path.empty()) std::cout << "[EXPORT] " << path << "\n";
    }

    logger.stop();
    return status.halted ? 2 : 0;
}

int main(int argc, char* argv[]) {
    chartagent::util::install_shutdown_handler(g_running);

    CLIArgs args;
    if (!parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        print_help();
        return 0;
    }

    return run(args);
}
