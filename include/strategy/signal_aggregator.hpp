#pragma once

#include "../logging/async_logger.hpp"
#include "istrategy.hpp"
#include "strategies.hpp"

#include <memory>
#include <vector>

namespace chartagent {
namespace strategy {

/**
 * SignalAggregator - runs every registered strategy against a snapshot
 *
 * Order of signals follows registration order. No early exit: a strategy
 * that has nothing to say still contributes a none signal.
 */
class SignalAggregator {
public:
    explicit SignalAggregator(logging::AsyncLogger* logger = nullptr) : logger_(logger) {}

    /**
     * The five built-in strategies, confirmation last.
     */
    static SignalAggregator with_default_strategies(logging::AsyncLogger* logger = nullptr) {
        SignalAggregator aggregator(logger);
        auto* trend = aggregator.add(std::make_unique<TrendFollowingStrategy>());
        auto* breakout = aggregator.add(std::make_unique<BreakoutStrategy>());
        auto* reversion = aggregator.add(std::make_unique<MeanReversionStrategy>());
        auto* pattern = aggregator.add(std::make_unique<PatternRecognitionStrategy>());
        aggregator.add(std::make_unique<ConfirmationStrategy>(
            std::vector<const IStrategy*>{trend, breakout, reversion, pattern}));
        return aggregator;
    }

    IStrategy* add(std::unique_ptr<IStrategy> strategy) {
        strategies_.push_back(std::move(strategy));
        return strategies_.back().get();
    }

    std::vector<StrategySignal> aggregate(const MarketSnapshot& snapshot) const {
        std::vector<StrategySignal> signals;
        signals.reserve(strategies_.size());
        for (const auto& s : strategies_) {
            signals.push_back(s->evaluate(snapshot));
            const auto& sig = signals.back();
            if (sig.fired()) {
                CA_LOGF(logger_, Debug, Strategy, "%s -> %s (%.2f)", sig.strategy_name.c_str(),
                        direction_to_string(sig.direction), sig.strength);
            }
        }
        return signals;
    }

    /**
     * Majority vote over fired signals. An exact tie (including one buy
     * against one sell) yields direction none.
     */
    static Consensus build_consensus(const std::vector<StrategySignal>& signals) {
        Consensus c;
        double buy_strength = 0, sell_strength = 0;

        for (const auto& s : signals) {
            if (!s.fired()) continue;
            c.triggered.push_back(s.strategy_name);
            if (s.direction == Direction::Buy) {
                ++c.buy_votes;
                buy_strength += s.strength;
            } else {
                ++c.sell_votes;
                sell_strength += s.strength;
            }
        }

        if (c.buy_votes > c.sell_votes) {
            c.direction = Direction::Buy;
            c.strength = buy_strength / c.buy_votes;
        } else if (c.sell_votes > c.buy_votes) {
            c.direction = Direction::Sell;
            c.strength = sell_strength / c.sell_votes;
        }
        return c;
    }

    size_t size() const { return strategies_.size(); }

private:
    std::vector<std::unique_ptr<IStrategy>> strategies_;
    logging::AsyncLogger* logger_;
};

} // namespace strategy
} // namespace chartagent
