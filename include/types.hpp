#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chartagent {

using Timestamp = uint64_t; // Wall-clock nanoseconds since Unix epoch
using TradeId = uint64_t;

constexpr TradeId INVALID_TRADE_ID = 0;

// =============================================================================
// Perception
// =============================================================================

// Raw image bytes as produced by the perception source (PNG/JPEG encoded)
struct Image {
    std::vector<uint8_t> bytes;
    std::string mime_type = "image/png";

    bool empty() const { return bytes.empty(); }
};

// Bounding box in image coordinates (normalized 0-1 when requested)
struct Rect {
    double x1 = 0;
    double y1 = 0;
    double x2 = 0;
    double y2 = 0;

    double center_x() const { return (x1 + x2) / 2; }
    double center_y() const { return (y1 + y2) / 2; }
};

enum class ElementKind : uint8_t { Text = 0, Icon };

inline const char* element_kind_to_string(ElementKind kind) {
    switch (kind) {
    case ElementKind::Text:
        return "text";
    case ElementKind::Icon:
        return "icon";
    default:
        return "unknown";
    }
}

struct ParsedElement {
    std::string text;
    ElementKind kind = ElementKind::Text;
    std::optional<Rect> bounding_box;
};

// Element distribution over the chart's vertical thirds
struct SpatialSummary {
    size_t top = 0;
    size_t middle = 0;
    size_t bottom = 0;
    size_t unplaced = 0; // No bounding box reported
};

// =============================================================================
// Market Snapshot
// =============================================================================

struct MarketSnapshot {
    std::string instrument;
    Timestamp observed_at = 0;
    std::map<std::string, double> indicators;   // "rsi", "macd", "volatility", ...
    std::map<std::string, double> price_levels; // "price", "support", "resistance", ...
    std::set<std::string> patterns;             // "bullish_engulfing", "doji", ...
    size_t element_count = 0;

    bool has_price_data() const { return !price_levels.empty(); }

    std::optional<double> indicator(const std::string& key) const {
        auto it = indicators.find(key);
        if (it == indicators.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<double> price_level(const std::string& key) const {
        auto it = price_levels.find(key);
        if (it == price_levels.end())
            return std::nullopt;
        return it->second;
    }

    // Best available reference price for execution and settlement
    std::optional<double> reference_price() const {
        for (const char* key : {"price", "close", "bid", "ask"}) {
            if (auto p = price_level(key))
                return p;
        }
        return std::nullopt;
    }
};

// =============================================================================
// Signals & Decisions
// =============================================================================

enum class Direction : uint8_t { None = 0, Buy, Sell };

inline const char* direction_to_string(Direction d) {
    switch (d) {
    case Direction::None:
        return "none";
    case Direction::Buy:
        return "buy";
    case Direction::Sell:
        return "sell";
    default:
        return "unknown";
    }
}

inline std::optional<Direction> direction_from_string(const std::string& s) {
    if (s == "buy")
        return Direction::Buy;
    if (s == "sell")
        return Direction::Sell;
    if (s == "none")
        return Direction::None;
    return std::nullopt;
}

struct StrategySignal {
    std::string strategy_name;
    Direction direction = Direction::None;
    double strength = 0; // [0, 1]

    bool fired() const { return direction != Direction::None; }

    static StrategySignal none(std::string name) { return StrategySignal{std::move(name), Direction::None, 0}; }
};

// Combined view over all strategy signals of one cycle
struct Consensus {
    Direction direction = Direction::None; // None = no signal or exact tie
    int buy_votes = 0;
    int sell_votes = 0;
    double strength = 0;                 // Mean strength of the majority side
    std::vector<std::string> triggered;  // Names of strategies that fired

    bool is_tie() const { return buy_votes > 0 && buy_votes == sell_votes; }
};

enum class Action : uint8_t { Hold = 0, Open };

inline const char* action_to_string(Action a) {
    switch (a) {
    case Action::Hold:
        return "hold";
    case Action::Open:
        return "open";
    default:
        return "unknown";
    }
}

struct Decision {
    Action action = Action::Hold;
    Direction direction = Direction::None;
    double confidence = 0; // [0, 1]
    std::vector<std::string> reasoning;
    std::optional<double> stop_loss_distance;   // Price units
    std::optional<double> take_profit_distance; // Price units
    double position_size_multiplier = 1.0;      // Ignored for Hold

    bool is_open() const { return action == Action::Open; }

    // Veto: a hold never carries a direction
    void force_hold(std::string reason) {
        action = Action::Hold;
        direction = Direction::None;
        reasoning.push_back(std::move(reason));
    }

    static Decision hold(std::string reason, double confidence = 0) {
        Decision d;
        d.confidence = confidence;
        if (!reason.empty())
            d.reasoning.push_back(std::move(reason));
        return d;
    }

    static Decision open(Direction dir, double confidence, std::vector<std::string> reasoning = {}) {
        Decision d;
        d.action = Action::Open;
        d.direction = dir;
        d.confidence = confidence;
        d.reasoning = std::move(reasoning);
        return d;
    }
};

// =============================================================================
// Execution & History
// =============================================================================

struct ExecutionResult {
    bool success = false;
    std::string order_id;
    Direction direction = Direction::None;
    double lot_size = 0;
    std::optional<double> fill_price;
    std::optional<double> profit_loss; // Known only if the venue reports it at fill time
    std::string message;
};

struct TradeRecord {
    TradeId id = INVALID_TRADE_ID;
    Timestamp timestamp = 0;
    Decision decision;
    std::optional<ExecutionResult> execution;
    std::optional<double> profit_loss; // Unresolved until settled
    std::vector<std::string> strategies_triggered;
    SpatialSummary spatial;

    bool is_resolved() const { return profit_loss.has_value(); }
    bool is_win() const { return profit_loss && *profit_loss > 0; }
    bool is_loss() const { return profit_loss && *profit_loss <= 0; }
};

struct PerformanceSnapshot {
    double win_rate = 0;  // Percent [0, 100]; 0 when no resolved trades
    int total_trades = 0; // Resolved trades only
    double cumulative_profit_loss = 0;
    int consecutive_losses = 0;

    double average_profit = 0;
    double average_loss = 0;
    double max_drawdown = 0; // Peak-to-trough on cumulative resolved P/L
    int unresolved_trades = 0;
};

// Settlement reported by an executor for a previously opened trade
struct Settlement {
    TradeId trade_id = INVALID_TRADE_ID;
    double profit_loss = 0;
    std::string reason; // "stop_loss", "take_profit", "venue"
};

} // namespace chartagent
