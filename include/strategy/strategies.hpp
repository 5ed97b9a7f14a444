#pragma once

/**
 * Built-in chart strategies
 *
 * Each reads a handful of indicators or levels from the snapshot and votes
 * buy, sell, or none. None of them keep state between cycles.
 */

#include "../config/defaults.hpp"
#include "../perception/snapshot_extractor.hpp"
#include "../util/pip_math.hpp"
#include "istrategy.hpp"

#include <algorithm>
#include <vector>

namespace chartagent {
namespace strategy {

namespace cfg = config::strategy;

// =============================================================================
// Trend Following: MACD direction, ADX strength
// =============================================================================

class TrendFollowingStrategy : public IStrategy {
public:
    static constexpr std::string_view NAME = "trend_following";

    StrategySignal evaluate(const MarketSnapshot& snapshot) const override {
        auto macd = snapshot.indicator("macd");
        if (!macd) return StrategySignal::none(std::string(NAME));

        auto adx = snapshot.indicator("adx");
        if (adx && *adx < cfg::ADX_MIN_TREND) {
            return StrategySignal::none(std::string(NAME)); // Ranging market
        }

        double strength = adx ? std::min(1.0, *adx / cfg::ADX_FULL_STRENGTH) : cfg::TREND_DEFAULT_STRENGTH;

        if (*macd > cfg::MACD_THRESHOLD) return make_signal(NAME, Direction::Buy, strength);
        if (*macd < -cfg::MACD_THRESHOLD) return make_signal(NAME, Direction::Sell, strength);
        return StrategySignal::none(std::string(NAME));
    }

    std::string_view name() const override { return NAME; }
};

// =============================================================================
// Breakout: price through resistance / support
// =============================================================================

class BreakoutStrategy : public IStrategy {
public:
    static constexpr std::string_view NAME = "breakout";

    StrategySignal evaluate(const MarketSnapshot& snapshot) const override {
        auto price = snapshot.reference_price();
        if (!price) return StrategySignal::none(std::string(NAME));

        auto resistance = snapshot.price_level("resistance");
        if (resistance && *price > *resistance) {
            double pips = util::price_to_pips(*price - *resistance, snapshot.instrument);
            return make_signal(NAME, Direction::Buy, pips / cfg::BREAKOUT_FULL_STRENGTH_PIPS);
        }

        auto support = snapshot.price_level("support");
        if (support && *price < *support) {
            double pips = util::price_to_pips(*support - *price, snapshot.instrument);
            return make_signal(NAME, Direction::Sell, pips / cfg::BREAKOUT_FULL_STRENGTH_PIPS);
        }

        return StrategySignal::none(std::string(NAME));
    }

    std::string_view name() const override { return NAME; }
};

// =============================================================================
// Mean Reversion: RSI extremes
// =============================================================================

class MeanReversionStrategy : public IStrategy {
public:
    static constexpr std::string_view NAME = "mean_reversion";

    StrategySignal evaluate(const MarketSnapshot& snapshot) const override {
        auto rsi = snapshot.indicator("rsi");
        if (!rsi) return StrategySignal::none(std::string(NAME));

        if (*rsi < cfg::RSI_OVERSOLD) {
            return make_signal(NAME, Direction::Buy, (cfg::RSI_OVERSOLD - *rsi) / cfg::RSI_ZONE_SPAN);
        }
        if (*rsi > cfg::RSI_OVERBOUGHT) {
            return make_signal(NAME, Direction::Sell, (*rsi - cfg::RSI_OVERBOUGHT) / cfg::RSI_ZONE_SPAN);
        }
        return StrategySignal::none(std::string(NAME));
    }

    std::string_view name() const override { return NAME; }
};

// =============================================================================
// Pattern Recognition: bullish vs bearish candlestick patterns
// =============================================================================

class PatternRecognitionStrategy : public IStrategy {
public:
    static constexpr std::string_view NAME = "pattern_recognition";

    StrategySignal evaluate(const MarketSnapshot& snapshot) const override {
        int bullish = 0;
        int bearish = 0;
        for (const auto& p : snapshot.patterns) {
            if (perception::is_bullish_pattern(p)) ++bullish;
            else if (perception::is_bearish_pattern(p)) ++bearish;
        }

        if (bullish == bearish) return StrategySignal::none(std::string(NAME));

        Direction dir = bullish > bearish ? Direction::Buy : Direction::Sell;
        int agreeing = std::max(bullish, bearish);
        return make_signal(NAME, dir, cfg::PATTERN_BASE_STRENGTH + cfg::PATTERN_STEP_STRENGTH * (agreeing - 1));
    }

    std::string_view name() const override { return NAME; }
};

// =============================================================================
// Confirmation: fires when enough of the other strategies agree
// =============================================================================

class ConfirmationStrategy : public IStrategy {
public:
    static constexpr std::string_view NAME = "confirmation";

    // Non-owning; the aggregator keeps the peers alive
    explicit ConfirmationStrategy(std::vector<const IStrategy*> peers,
                                  int min_agreeing = cfg::CONFIRMATION_MIN_AGREEING)
        : peers_(std::move(peers)), min_agreeing_(min_agreeing) {}

    StrategySignal evaluate(const MarketSnapshot& snapshot) const override {
        int buys = 0, sells = 0;
        double buy_strength = 0, sell_strength = 0;

        for (const auto* peer : peers_) {
            StrategySignal s = peer->evaluate(snapshot);
            if (s.direction == Direction::Buy) {
                ++buys;
                buy_strength += s.strength;
            } else if (s.direction == Direction::Sell) {
                ++sells;
                sell_strength += s.strength;
            }
        }

        if (buys >= min_agreeing_ && buys > sells) {
            return make_signal(NAME, Direction::Buy, buy_strength / buys);
        }
        if (sells >= min_agreeing_ && sells > buys) {
            return make_signal(NAME, Direction::Sell, sell_strength / sells);
        }
        return StrategySignal::none(std::string(NAME));
    }

    std::string_view name() const override { return NAME; }

private:
    std::vector<const IStrategy*> peers_;
    int min_agreeing_;
};

} // namespace strategy
} // namespace chartagent
