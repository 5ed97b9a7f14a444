#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/pip_math.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace chartagent {
namespace risk {

struct RiskPolicy {
    int32_t min_trades_for_win_rate = config::risk::MIN_TRADES_FOR_WIN_RATE;
    double low_win_rate_pct = config::risk::LOW_WIN_RATE_PCT;
    double high_win_rate_pct = config::risk::HIGH_WIN_RATE_PCT;
    double low_win_rate_factor = config::risk::LOW_WIN_RATE_FACTOR;
    double high_win_rate_factor = config::risk::HIGH_WIN_RATE_FACTOR;

    size_t loss_streak_length = config::risk::LOSS_STREAK_LENGTH;
    double loss_streak_factor = config::risk::LOSS_STREAK_FACTOR;
    double loss_streak_min_confidence = config::risk::LOSS_STREAK_MIN_CONFIDENCE;

    double high_volatility_threshold = config::risk::HIGH_VOLATILITY_THRESHOLD;
    double high_volatility_factor = config::risk::HIGH_VOLATILITY_FACTOR;
    double high_volatility_stop_widen = config::risk::HIGH_VOLATILITY_STOP_WIDEN;

    double min_multiplier = config::risk::MIN_POSITION_MULTIPLIER;
    double max_multiplier = config::risk::MAX_POSITION_MULTIPLIER;

    double default_stop_loss_pips = config::risk::DEFAULT_STOP_LOSS_PIPS;
    double reward_to_risk = config::risk::REWARD_TO_RISK;
};

/**
 * RiskManager - sizes, vetoes and bounds a proposed decision
 *
 * Rules run in a fixed order and each one that fires appends a reason:
 *   1. Anything but Open passes through untouched
 *   2. Poor win rate (enough trades)        -> size x 0.5
 *   3. else strong win rate (enough trades) -> size x 1.2
 *   4. Last three trades all lost           -> size x 0.5, and veto to
 *                                              Hold below 0.7 confidence
 *   5. High volatility                      -> size x 0.7, wider stop
 *   6. Clamp size multiplier to [0.1, 2.0]
 * Missing stop / take-profit distances are then filled in.
 *
 * Stateless: the same inputs always produce the same decision.
 */
class RiskManager {
public:
    explicit RiskManager(RiskPolicy policy = {}, logging::AsyncLogger* logger = nullptr)
        : policy_(policy), logger_(logger) {}

    /**
     * @param decision Oracle proposal
     * @param performance Metrics over the retained history
     * @param recent_outcomes Latest trades, oldest first
     * @param snapshot Current snapshot (volatility, instrument)
     */
    Decision adjust(Decision decision, const PerformanceSnapshot& performance,
                    const std::vector<TradeRecord>& recent_outcomes, const MarketSnapshot& snapshot) const {
        // Rule 1
        if (!decision.is_open()) return decision;

        char buf[160];

        // Rules 2-3
        if (performance.total_trades > policy_.min_trades_for_win_rate) {
            if (performance.win_rate < policy_.low_win_rate_pct) {
                decision.position_size_multiplier *= policy_.low_win_rate_factor;
                std::snprintf(buf, sizeof(buf), "Risk: win rate %.1f%% below %.0f%%, size x%.2f", performance.win_rate,
                              policy_.low_win_rate_pct, policy_.low_win_rate_factor);
                add_reason(decision, buf);
            } else if (performance.win_rate > policy_.high_win_rate_pct) {
                decision.position_size_multiplier *= policy_.high_win_rate_factor;
                std::snprintf(buf, sizeof(buf), "Risk: win rate %.1f%% above %.0f%%, size x%.2f", performance.win_rate,
                              policy_.high_win_rate_pct, policy_.high_win_rate_factor);
                add_reason(decision, buf);
            }
        }

        // Rule 4
        if (last_n_all_losses(recent_outcomes, policy_.loss_streak_length)) {
            decision.position_size_multiplier *= policy_.loss_streak_factor;
            std::snprintf(buf, sizeof(buf), "Risk: last %zu trades lost, size x%.2f", policy_.loss_streak_length,
                          policy_.loss_streak_factor);
            add_reason(decision, buf);

            if (decision.confidence < policy_.loss_streak_min_confidence) {
                std::snprintf(buf, sizeof(buf), "Risk: confidence %.2f below %.2f after loss streak, holding",
                              decision.confidence, policy_.loss_streak_min_confidence);
                decision.force_hold(buf);
                decision.stop_loss_distance.reset();
                decision.take_profit_distance.reset();
                clamp_multiplier(decision);
                CA_LOGF(logger_, Info, Risk, "%s", buf);
                return decision;
            }
        }

        // Rule 5
        bool high_volatility = false;
        if (auto vol = snapshot.indicator("volatility"); vol && *vol > policy_.high_volatility_threshold) {
            high_volatility = true;
            decision.position_size_multiplier *= policy_.high_volatility_factor;
            std::snprintf(buf, sizeof(buf), "Risk: volatility %.2f above %.2f, size x%.2f", *vol,
                          policy_.high_volatility_threshold, policy_.high_volatility_factor);
            add_reason(decision, buf);
        }

        // Rule 6
        clamp_multiplier(decision);

        fill_stops(decision, snapshot.instrument, high_volatility);
        return decision;
    }

    /**
     * True when the newest n outcomes exist and are all resolved losses.
     */
    static bool last_n_all_losses(const std::vector<TradeRecord>& outcomes, size_t n) {
        if (n == 0 || outcomes.size() < n) return false;
        return std::all_of(outcomes.end() - static_cast<std::ptrdiff_t>(n), outcomes.end(),
                           [](const TradeRecord& t) { return t.is_loss(); });
    }

    const RiskPolicy& policy() const { return policy_; }

private:
    RiskPolicy policy_;
    logging::AsyncLogger* logger_;

    void add_reason(Decision& decision, const char* reason) const {
        decision.reasoning.emplace_back(reason);
        CA_LOGF(logger_, Debug, Risk, "%s", reason);
    }

    void clamp_multiplier(Decision& decision) const {
        double before = decision.position_size_multiplier;
        decision.position_size_multiplier = std::clamp(before, policy_.min_multiplier, policy_.max_multiplier);
        if (decision.position_size_multiplier != before && decision.is_open()) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "Risk: size multiplier %.3f clamped to %.3f", before,
                          decision.position_size_multiplier);
            add_reason(decision, buf);
        }
    }

    void fill_stops(Decision& decision, const std::string& instrument, bool high_volatility) const {
        if (!decision.stop_loss_distance) {
            double pips = policy_.default_stop_loss_pips;
            if (high_volatility) pips *= policy_.high_volatility_stop_widen;
            decision.stop_loss_distance = util::pips_to_price(pips, instrument);
        }
        if (!decision.take_profit_distance) {
            decision.take_profit_distance = *decision.stop_loss_distance * policy_.reward_to_risk;
        }
    }
};

} // namespace risk
} // namespace chartagent
