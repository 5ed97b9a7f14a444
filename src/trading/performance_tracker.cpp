#include "../../include/trading/performance_tracker.hpp"

#include <algorithm>

namespace chartagent::trading {

TradeId PerformanceTracker::record(TradeRecord trade) {
    if (trade.id == INVALID_TRADE_ID) {
        trade.id = next_id_++;
    } else if (trade.id >= next_id_) {
        next_id_ = trade.id + 1;
    }

    TradeId id = trade.id;
    history_.push_back(std::move(trade));
    while (history_.size() > capacity_) {
        history_.pop_front();
    }
    return id;
}

bool PerformanceTracker::resolve(TradeId id, double profit_loss) {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->id == id) {
            it->profit_loss = profit_loss;
            if (it->execution) {
                it->execution->profit_loss = profit_loss;
            }
            return true;
        }
    }
    return false;
}

PerformanceSnapshot PerformanceTracker::snapshot() const {
    PerformanceSnapshot snap;

    int wins = 0;
    int losses = 0;
    double total_profit = 0;
    double total_loss = 0;
    double peak = 0;
    double equity = 0;

    for (const auto& trade : history_) {
        if (!trade.is_resolved()) {
            ++snap.unresolved_trades;
            continue;
        }

        double pnl = *trade.profit_loss;
        ++snap.total_trades;
        snap.cumulative_profit_loss += pnl;

        if (trade.is_win()) {
            ++wins;
            total_profit += pnl;
        } else {
            ++losses;
            total_loss += pnl;
        }

        equity += pnl;
        peak = std::max(peak, equity);
        snap.max_drawdown = std::max(snap.max_drawdown, peak - equity);
    }

    if (snap.total_trades > 0) {
        snap.win_rate = 100.0 * wins / snap.total_trades;
    }
    snap.average_profit = wins > 0 ? total_profit / wins : 0.0;
    snap.average_loss = losses > 0 ? total_loss / losses : 0.0;

    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (!it->is_loss()) break;
        ++snap.consecutive_losses;
    }

    return snap;
}

std::vector<TradeRecord> PerformanceTracker::recent(size_t n) const {
    size_t count = std::min(n, history_.size());
    return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}

void PerformanceTracker::restore(const std::vector<TradeRecord>& records) {
    history_.clear();
    next_id_ = 1;
    for (const auto& r : records) {
        record(r);
    }
}

} // namespace chartagent::trading
