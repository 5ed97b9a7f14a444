#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the chart agent.
 *
 * All default values are defined here to avoid duplication across:
 * - AgentConfig (runtime overrides)
 * - RiskPolicy
 * - Strategy thresholds
 * - CircuitBreaker / PerformanceTracker capacities
 *
 * Naming:
 * - _PCT suffix: percentage in percent units (40.0 = 40%)
 * - _PIPS suffix: distance in pips of the traded instrument
 * - _MS suffix: milliseconds
 */

namespace chartagent::config {

// =============================================================================
// Scheduling
// =============================================================================
namespace scheduling {
constexpr uint32_t POLLING_INTERVAL_MS = 30000; // One cycle every 30s
constexpr uint32_t SERVICE_TIMEOUT_MS = 30000;  // Per external call
constexpr size_t MIN_PARSED_ELEMENTS = 3;       // Below this the cycle is skipped
} // namespace scheduling

// =============================================================================
// Trade History
// =============================================================================
namespace history {
constexpr size_t CAPACITY = 100;        // FIFO eviction beyond this
constexpr size_t ORACLE_CONTEXT = 5;    // Trades sent to the oracle
constexpr size_t RISK_LOOKBACK = 3;     // Trades inspected for loss streaks
} // namespace history

// =============================================================================
// Circuit Breaker
// =============================================================================
namespace breaker {
constexpr int32_t FAILURE_THRESHOLD = 5; // Consecutive failed cycles before halt
} // namespace breaker

// =============================================================================
// Risk Policy
// =============================================================================
namespace risk {
// Win-rate scaling only applies once the sample is meaningful
constexpr int32_t MIN_TRADES_FOR_WIN_RATE = 10;
constexpr double LOW_WIN_RATE_PCT = 40.0;
constexpr double HIGH_WIN_RATE_PCT = 60.0;
constexpr double LOW_WIN_RATE_FACTOR = 0.5;
constexpr double HIGH_WIN_RATE_FACTOR = 1.2;

// Loss streak
constexpr size_t LOSS_STREAK_LENGTH = 3;
constexpr double LOSS_STREAK_FACTOR = 0.5;
constexpr double LOSS_STREAK_MIN_CONFIDENCE = 0.7; // Below this the trade is vetoed

// Volatility
constexpr double HIGH_VOLATILITY_THRESHOLD = 2.0; // "volatility" indicator, percent
constexpr double HIGH_VOLATILITY_FACTOR = 0.7;
constexpr double HIGH_VOLATILITY_STOP_WIDEN = 1.5;

// Clamp
constexpr double MIN_POSITION_MULTIPLIER = 0.1;
constexpr double MAX_POSITION_MULTIPLIER = 2.0;

// Stops
constexpr double DEFAULT_STOP_LOSS_PIPS = 20.0;
constexpr double REWARD_TO_RISK = 2.0; // take-profit = stop * 2
} // namespace risk

// =============================================================================
// Strategy Thresholds
// =============================================================================
namespace strategy {
constexpr double RSI_OVERSOLD = 30.0;
constexpr double RSI_OVERBOUGHT = 70.0;
constexpr double RSI_ZONE_SPAN = 30.0; // Strength = depth into zone / span

constexpr double MACD_THRESHOLD = 0.0;
constexpr double ADX_MIN_TREND = 20.0; // Below: no trend worth following
constexpr double ADX_FULL_STRENGTH = 50.0;
constexpr double TREND_DEFAULT_STRENGTH = 0.5;

constexpr double BREAKOUT_FULL_STRENGTH_PIPS = 20.0;

constexpr double PATTERN_BASE_STRENGTH = 0.6;
constexpr double PATTERN_STEP_STRENGTH = 0.1; // Per extra agreeing pattern

constexpr int32_t CONFIRMATION_MIN_AGREEING = 2;
} // namespace strategy

// =============================================================================
// Parsing Service
// =============================================================================
namespace parsing {
constexpr double BOX_THRESHOLD = 0.05; // Detection confidence
constexpr double IOU_THRESHOLD = 0.1;  // Overlap suppression
constexpr bool NORMALIZE_COORDINATES = true;
} // namespace parsing

// =============================================================================
// Decision Oracle
// =============================================================================
namespace oracle {
constexpr const char* DEFAULT_URL = "https://api.openai.com/v1/chat/completions";
constexpr const char* DEFAULT_MODEL = "gpt-4";
constexpr double TEMPERATURE = 0.3;
constexpr int32_t MAX_TOKENS = 500;
constexpr double MISSING_CONFIDENCE = 0.5; // Used when the oracle omits it
constexpr double PERCENT_FORM_ABOVE = 1.5;  // Larger bare numbers are percentages
} // namespace oracle

// =============================================================================
// Trading
// =============================================================================
namespace trading {
constexpr const char* DEFAULT_INSTRUMENT = "EURUSD";
constexpr double DEFAULT_LOT_SIZE = 0.01;
constexpr double CONTRACT_UNITS = 100000.0; // Units per standard lot
} // namespace trading

// =============================================================================
// Feature Flags
// =============================================================================
namespace flags {
constexpr bool PAPER_TRADING = true; // Default to paper
} // namespace flags

} // namespace chartagent::config
