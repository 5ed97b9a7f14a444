#pragma once

/**
 * PaperTradeExecutor - simulated fills for paper trading
 *
 * Orders fill instantly at the snapshot price. Each fill becomes an open
 * paper position with a stop and target; a later snapshot whose price
 * reaches either level closes it at that level and produces a Settlement.
 * Realized P/L is credited to the paper balance; once the balance is gone
 * further orders fail with BalanceInsufficient.
 */

#include "../logging/async_logger.hpp"
#include "../util/pip_math.hpp"
#include "itrade_executor.hpp"

#include <string>
#include <vector>

namespace chartagent {
namespace execution {

struct PaperPosition {
    TradeId trade_id = INVALID_TRADE_ID;
    std::string instrument;
    Direction direction = Direction::None;
    double lot_size = 0;
    double entry_price = 0;
    double stop_price = 0;
    double target_price = 0;
};

class PaperTradeExecutor : public ITradeExecutor {
public:
    explicit PaperTradeExecutor(double initial_balance = 10000.0, logging::AsyncLogger* logger = nullptr)
        : balance_(initial_balance), logger_(logger) {}

    ExecutionResponse execute(const ExecutionRequest& request) override {
        ExecutionResponse response;

        if (balance_ <= 0) {
            response.error = ServiceError{ErrorCategory::BalanceInsufficient, "Account balance too low"};
            return response;
        }
        if (request.direction == Direction::None || request.lot_size <= 0) {
            response.error = ServiceError::transient("Invalid order: no direction or size");
            return response;
        }
        if (!request.reference_price || *request.reference_price <= 0) {
            response.error = ServiceError::transient("No reference price for paper fill");
            return response;
        }

        double entry = *request.reference_price;
        double stop = request.stop_loss_distance.value_or(0);
        double target = request.take_profit_distance.value_or(0);
        bool is_buy = request.direction == Direction::Buy;

        PaperPosition position;
        position.trade_id = request.trade_id;
        position.instrument = request.instrument;
        position.direction = request.direction;
        position.lot_size = request.lot_size;
        position.entry_price = entry;
        position.stop_price = stop > 0 ? (is_buy ? entry - stop : entry + stop) : 0;
        position.target_price = target > 0 ? (is_buy ? entry + target : entry - target) : 0;
        positions_.push_back(position);

        response.success = true;
        response.result.success = true;
        response.result.order_id = "paper-" + std::to_string(++order_seq_);
        response.result.direction = request.direction;
        response.result.lot_size = request.lot_size;
        response.result.fill_price = entry;
        response.result.message = "Simulated fill";

        CA_LOGF(logger_, Info, Execution, "[PAPER] %s %.2f lots %s @ %.5f (stop %.5f, target %.5f)",
                direction_to_string(request.direction), request.lot_size, request.instrument.c_str(), entry,
                position.stop_price, position.target_price);
        return response;
    }

    std::vector<Settlement> settle(const MarketSnapshot& snapshot) override {
        std::vector<Settlement> settled;
        auto price = snapshot.reference_price();
        if (!price) return settled;

        for (auto it = positions_.begin(); it != positions_.end();) {
            const auto& p = *it;
            if (p.instrument != snapshot.instrument) {
                ++it;
                continue;
            }

            bool is_buy = p.direction == Direction::Buy;
            bool stop_hit = p.stop_price > 0 && (is_buy ? *price <= p.stop_price : *price >= p.stop_price);
            bool target_hit = p.target_price > 0 && (is_buy ? *price >= p.target_price : *price <= p.target_price);

            if (!stop_hit && !target_hit) {
                ++it;
                continue;
            }

            double exit = stop_hit ? p.stop_price : p.target_price;
            double pnl = util::profit_loss(is_buy, p.entry_price, exit, p.lot_size, p.instrument);
            balance_ += pnl;
            settled.push_back(Settlement{p.trade_id, pnl, stop_hit ? "stop_loss" : "take_profit"});

            CA_LOGF(logger_, Info, Execution, "[PAPER] trade %lu closed by %s @ %.5f, P/L %.2f",
                    static_cast<unsigned long>(p.trade_id), stop_hit ? "stop" : "target", exit, pnl);
            it = positions_.erase(it);
        }
        return settled;
    }

    std::string_view name() const override { return "paper"; }

    double balance() const { return balance_; }
    const std::vector<PaperPosition>& open_positions() const { return positions_; }

private:
    double balance_;
    std::vector<PaperPosition> positions_;
    uint64_t order_seq_ = 0;
    logging::AsyncLogger* logger_;
};

} // namespace execution
} // namespace chartagent
