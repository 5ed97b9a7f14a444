#include "../include/risk/risk_manager.hpp"
#include "../include/strategy/signal_aggregator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace chartagent;
using namespace chartagent::strategy;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

static MarketSnapshot base_snapshot() {
    MarketSnapshot s;
    s.instrument = "EURUSD";
    s.price_levels["price"] = 1.1000;
    s.element_count = 5;
    return s;
}

static StrategySignal sig(const char* name, Direction d, double strength) {
    return StrategySignal{name, d, strength};
}

// =============================================================================
// Individual strategies
// =============================================================================

TEST(trend_following_uses_macd_and_adx) {
    TrendFollowingStrategy trend;
    auto s = base_snapshot();

    ASSERT_FALSE(trend.evaluate(s).fired()); // No MACD

    s.indicators["macd"] = 0.002;
    auto no_adx = trend.evaluate(s);
    ASSERT_EQ(no_adx.direction, Direction::Buy);
    ASSERT_NEAR(no_adx.strength, 0.5, 1e-9);

    s.indicators["adx"] = 30;
    auto with_adx = trend.evaluate(s);
    ASSERT_NEAR(with_adx.strength, 0.6, 1e-9);

    s.indicators["adx"] = 80;
    ASSERT_NEAR(trend.evaluate(s).strength, 1.0, 1e-9);

    s.indicators["adx"] = 15; // Ranging
    ASSERT_FALSE(trend.evaluate(s).fired());

    s.indicators["adx"] = 25;
    s.indicators["macd"] = -0.001;
    ASSERT_EQ(trend.evaluate(s).direction, Direction::Sell);

    s.indicators["macd"] = 0.0;
    ASSERT_FALSE(trend.evaluate(s).fired());
}

TEST(breakout_measures_distance_in_pips) {
    BreakoutStrategy breakout;
    auto s = base_snapshot();
    s.price_levels["resistance"] = 1.0990; // 10 pips below price

    auto up = breakout.evaluate(s);
    ASSERT_EQ(up.direction, Direction::Buy);
    ASSERT_NEAR(up.strength, 0.5, 1e-6);

    s.price_levels["resistance"] = 1.0900; // 100 pips: capped
    ASSERT_NEAR(breakout.evaluate(s).strength, 1.0, 1e-9);

    s.price_levels["resistance"] = 1.1100;
    s.price_levels["support"] = 1.1005; // 5 pips above price
    auto down = breakout.evaluate(s);
    ASSERT_EQ(down.direction, Direction::Sell);
    ASSERT_NEAR(down.strength, 0.25, 1e-6);

    s.price_levels["support"] = 1.0950; // Inside the range
    ASSERT_FALSE(breakout.evaluate(s).fired());
}

TEST(breakout_jpy_pip_size) {
    BreakoutStrategy breakout;
    MarketSnapshot s;
    s.instrument = "USDJPY";
    s.price_levels["price"] = 150.20;
    s.price_levels["resistance"] = 150.10; // 10 pips at 0.01

    ASSERT_NEAR(breakout.evaluate(s).strength, 0.5, 1e-6);
}

TEST(mean_reversion_rsi_zones) {
    MeanReversionStrategy mr;
    auto s = base_snapshot();

    s.indicators["rsi"] = 15;
    auto buy = mr.evaluate(s);
    ASSERT_EQ(buy.direction, Direction::Buy);
    ASSERT_NEAR(buy.strength, 0.5, 1e-9);

    s.indicators["rsi"] = 79;
    auto sell = mr.evaluate(s);
    ASSERT_EQ(sell.direction, Direction::Sell);
    ASSERT_NEAR(sell.strength, 0.3, 1e-9);

    s.indicators["rsi"] = 30; // Boundary is neutral
    ASSERT_FALSE(mr.evaluate(s).fired());
    s.indicators["rsi"] = 70;
    ASSERT_FALSE(mr.evaluate(s).fired());
}

TEST(pattern_recognition_majority) {
    PatternRecognitionStrategy pr;
    auto s = base_snapshot();

    s.patterns = {"hammer", "morning_star", "shooting_star", "doji"};
    auto buy = pr.evaluate(s);
    ASSERT_EQ(buy.direction, Direction::Buy);
    ASSERT_NEAR(buy.strength, 0.7, 1e-9); // 0.6 + one extra agreeing

    s.patterns = {"hammer", "shooting_star"};
    ASSERT_FALSE(pr.evaluate(s).fired());

    s.patterns = {"evening_star"};
    auto sell = pr.evaluate(s);
    ASSERT_EQ(sell.direction, Direction::Sell);
    ASSERT_NEAR(sell.strength, 0.6, 1e-9);

    s.patterns = {"doji"};
    ASSERT_FALSE(pr.evaluate(s).fired());
}

TEST(confirmation_needs_two_agreeing) {
    MeanReversionStrategy mr;
    TrendFollowingStrategy trend;
    ConfirmationStrategy confirm({&mr, &trend});

    auto s = base_snapshot();
    s.indicators["rsi"] = 15;  // buy 0.5
    ASSERT_FALSE(confirm.evaluate(s).fired());

    s.indicators["macd"] = 0.01; // buy 0.5 (no adx)
    auto both = confirm.evaluate(s);
    ASSERT_EQ(both.direction, Direction::Buy);
    ASSERT_NEAR(both.strength, 0.5, 1e-9);

    s.indicators["macd"] = -0.01; // now 1 buy, 1 sell
    ASSERT_FALSE(confirm.evaluate(s).fired());
}

// =============================================================================
// Aggregation
// =============================================================================

TEST(aggregate_evaluates_every_strategy_in_order) {
    auto agg = SignalAggregator::with_default_strategies();
    ASSERT_EQ(agg.size(), 5u);

    auto signals = agg.aggregate(base_snapshot()); // Nothing fires
    ASSERT_EQ(signals.size(), 5u);
    ASSERT_EQ(signals[0].strategy_name, "trend_following");
    ASSERT_EQ(signals[1].strategy_name, "breakout");
    ASSERT_EQ(signals[2].strategy_name, "mean_reversion");
    ASSERT_EQ(signals[3].strategy_name, "pattern_recognition");
    ASSERT_EQ(signals[4].strategy_name, "confirmation");
    for (const auto& s : signals) {
        ASSERT_FALSE(s.fired());
    }
}

TEST(aggregate_is_deterministic) {
    auto agg = SignalAggregator::with_default_strategies();
    auto s = base_snapshot();
    s.indicators["rsi"] = 22;
    s.indicators["macd"] = 0.003;
    s.indicators["adx"] = 40;
    s.patterns = {"hammer"};

    auto a = agg.aggregate(s);
    auto b = agg.aggregate(s);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        ASSERT_EQ(a[i].direction, b[i].direction);
        ASSERT_EQ(a[i].strength, b[i].strength);
    }

    // trend, reversion, pattern buy -> confirmation buys too
    ASSERT_EQ(a[4].direction, Direction::Buy);
    auto c = SignalAggregator::build_consensus(a);
    ASSERT_EQ(c.direction, Direction::Buy);
    ASSERT_EQ(c.buy_votes, 4);
    ASSERT_EQ(c.sell_votes, 0);
    ASSERT_EQ(c.triggered.size(), 4u);
}

TEST(consensus_majority_direction) {
    auto c = SignalAggregator::build_consensus({
        sig("a", Direction::Sell, 0.8),
        sig("b", Direction::Sell, 0.4),
        sig("c", Direction::Buy, 0.9),
        sig("d", Direction::None, 0),
    });

    ASSERT_EQ(c.direction, Direction::Sell);
    ASSERT_EQ(c.sell_votes, 2);
    ASSERT_EQ(c.buy_votes, 1);
    ASSERT_NEAR(c.strength, 0.6, 1e-9);
    ASSERT_EQ(c.triggered.size(), 3u);
    ASSERT_FALSE(c.is_tie());
}

TEST(consensus_tie_holds) {
    auto c = SignalAggregator::build_consensus({
        sig("a", Direction::Buy, 0.8),
        sig("b", Direction::Sell, 0.8),
    });

    ASSERT_EQ(c.direction, Direction::None);
    ASSERT_TRUE(c.is_tie());
    ASSERT_EQ(c.strength, 0.0);
}

TEST(consensus_no_signals) {
    auto c = SignalAggregator::build_consensus({sig("a", Direction::None, 0)});

    ASSERT_EQ(c.direction, Direction::None);
    ASSERT_FALSE(c.is_tie());
    ASSERT_TRUE(c.triggered.empty());
}

// =============================================================================
// Aggregation into risk
// =============================================================================

TEST(oversold_engulfing_buys_at_full_size) {
    auto agg = SignalAggregator::with_default_strategies();
    auto s = base_snapshot();
    s.indicators["rsi"] = 25;
    s.patterns = {"bullish_engulfing"};

    auto signals = agg.aggregate(s);
    ASSERT_EQ(signals[2].direction, Direction::Buy); // mean_reversion
    ASSERT_NEAR(signals[2].strength, 5.0 / 30.0, 1e-9);
    ASSERT_EQ(signals[3].direction, Direction::Buy); // pattern_recognition
    ASSERT_NEAR(signals[3].strength, 0.6, 1e-9);
    ASSERT_FALSE(signals[0].fired());
    ASSERT_FALSE(signals[1].fired());

    auto c = SignalAggregator::build_consensus(signals);
    ASSERT_EQ(c.direction, Direction::Buy);
    ASSERT_EQ(c.sell_votes, 0);
    ASSERT_EQ(c.triggered[0], "mean_reversion");
    ASSERT_EQ(c.triggered[1], "pattern_recognition");

    risk::RiskManager rm;
    auto out = rm.adjust(Decision::open(c.direction, c.strength), PerformanceSnapshot{}, {}, s);
    ASSERT_TRUE(out.is_open());
    ASSERT_EQ(out.direction, Direction::Buy);
    ASSERT_EQ(out.position_size_multiplier, 1.0);
}

int main() {
    std::cout << "\n=== Signal Aggregator Tests ===\n\n";

    RUN_TEST(trend_following_uses_macd_and_adx);
    RUN_TEST(breakout_measures_distance_in_pips);
    RUN_TEST(breakout_jpy_pip_size);
    RUN_TEST(mean_reversion_rsi_zones);
    RUN_TEST(pattern_recognition_majority);
    RUN_TEST(confirmation_needs_two_agreeing);
    RUN_TEST(aggregate_evaluates_every_strategy_in_order);
    RUN_TEST(aggregate_is_deterministic);
    RUN_TEST(consensus_majority_direction);
    RUN_TEST(consensus_tie_holds);
    RUN_TEST(consensus_no_signals);
    RUN_TEST(oversold_engulfing_buys_at_full_size);

    std::cout << "\n=== All Signal Aggregator Tests Passed! ===\n";
    return 0;
}
