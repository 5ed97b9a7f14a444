#pragma once

#include "../core/service_error.hpp"
#include "../types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chartagent {
namespace execution {

struct ExecutionRequest {
    TradeId trade_id = INVALID_TRADE_ID;
    std::string instrument;
    Direction direction = Direction::None;
    double lot_size = 0;
    std::optional<double> stop_loss_distance;   // Price units
    std::optional<double> take_profit_distance; // Price units
    std::optional<double> reference_price;      // Snapshot price at decision time
    double confidence = 0;
};

struct ExecutionResponse {
    bool success = false;
    ExecutionResult result;
    ServiceError error;
};

/**
 * ITradeExecutor - Unified execution interface for both paper and live
 *
 * execute() is called at most once per cycle, only for Open decisions.
 * settle() is called every cycle with the fresh snapshot and reports P/L
 * for trades the venue (or the simulator) has closed since the last call.
 */
class ITradeExecutor {
public:
    virtual ~ITradeExecutor() = default;

    virtual ExecutionResponse execute(const ExecutionRequest& request) = 0;

    virtual std::vector<Settlement> settle(const MarketSnapshot& snapshot) {
        (void)snapshot;
        return {};
    }

    virtual std::string_view name() const = 0;
};

} // namespace execution
} // namespace chartagent
