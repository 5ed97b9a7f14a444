#pragma once

/**
 * TradingCycle - one pass of perceive -> decide -> execute -> record
 *
 * Pipeline:
 *   capture -> parse -> validate -> extract -> settle open trades
 *     -> aggregate signals -> oracle -> risk -> execute -> record
 *
 * Every external call is made once, in order, with no retries. The first
 * failing call ends the cycle with outcome Failed and its ServiceError.
 * Too few parsed elements, or a snapshot without prices, ends it as
 * InsufficientData with no error.
 *
 * Owns the per-cycle components and the trade history; all of them are
 * touched only from inside run().
 */

#include "../config/defaults.hpp"
#include "../core/service_error.hpp"
#include "../execution/itrade_executor.hpp"
#include "../logging/async_logger.hpp"
#include "../oracle/idecision_oracle.hpp"
#include "../perception/parsing_service.hpp"
#include "../perception/perception_source.hpp"
#include "../perception/snapshot_extractor.hpp"
#include "../risk/risk_manager.hpp"
#include "../strategy/signal_aggregator.hpp"
#include "../trading/performance_tracker.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chartagent {
namespace core {

enum class CycleOutcome : uint8_t {
    None = 0,         // No cycle has run yet
    Executed,         // Trade opened and recorded
    Held,             // Decision was hold (oracle or risk veto)
    InsufficientData, // Perception produced nothing usable
    Failed            // An external call failed
};

inline const char* cycle_outcome_to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::None: return "none";
        case CycleOutcome::Executed: return "executed";
        case CycleOutcome::Held: return "held";
        case CycleOutcome::InsufficientData: return "insufficient_data";
        case CycleOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

struct CycleReport {
    CycleOutcome outcome = CycleOutcome::None;
    std::string stage; // Stage that ended the cycle early
    ServiceError error;
    Decision decision;
    std::optional<ExecutionResult> execution;
    TradeId trade_id = INVALID_TRADE_ID;
    size_t settlements = 0;
    uint64_t duration_ns = 0;
};

// Collaborators are borrowed; the caller keeps them alive
struct CycleServices {
    perception::IPerceptionSource* perception = nullptr;
    perception::IParsingService* parser = nullptr;
    oracle::IDecisionOracle* oracle = nullptr;
    execution::ITradeExecutor* executor = nullptr;
};

struct CycleSettings {
    std::string instrument = config::trading::DEFAULT_INSTRUMENT;
    double lot_size = config::trading::DEFAULT_LOT_SIZE;
    perception::ParseOptions parse_options;
    size_t min_parsed_elements = config::scheduling::MIN_PARSED_ELEMENTS;
    size_t oracle_context = config::history::ORACLE_CONTEXT;
    size_t risk_lookback = config::history::RISK_LOOKBACK;
    size_t history_capacity = config::history::CAPACITY;
};

class TradingCycle {
public:
    TradingCycle(CycleServices services, CycleSettings settings, risk::RiskPolicy policy = {},
                 logging::AsyncLogger* logger = nullptr);

    CycleReport run();

    trading::PerformanceTracker& tracker() { return tracker_; }
    const trading::PerformanceTracker& tracker() const { return tracker_; }
    const CycleSettings& settings() const { return settings_; }

    /**
     * Lots actually sent: base lot scaled by the risk multiplier, rounded
     * down to the 0.01 lot step, never below one step.
     */
    static double scaled_lot_size(double base_lots, double multiplier);

private:
    CycleServices services_;
    CycleSettings settings_;
    perception::MarketSnapshotExtractor extractor_;
    strategy::SignalAggregator aggregator_;
    risk::RiskManager risk_;
    trading::PerformanceTracker tracker_;
    logging::AsyncLogger* logger_;

    CycleReport fail(CycleReport report, const char* stage, ServiceError error) const;
    size_t apply_settlements(const MarketSnapshot& snapshot);
};

} // namespace core
} // namespace chartagent
