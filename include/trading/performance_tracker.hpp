#pragma once

/**
 * PerformanceTracker - rolling trade history and the metrics derived from it
 *
 * History is a FIFO capped at `capacity` records; the oldest record is
 * evicted first. Metrics are recomputed from the retained history on every
 * snapshot() so they can never drift from it.
 *
 * Key rules:
 *   - A trade counts toward win rate only once its P/L is known.
 *   - A win is P/L > 0; zero or negative P/L is a loss.
 *   - The loss streak counts back from the newest record and stops at the
 *     first win or unresolved trade.
 *
 * Usage:
 *   PerformanceTracker tracker;
 *   TradeId id = tracker.record(trade);
 *   tracker.resolve(id, -12.5);
 *   double wr = tracker.snapshot().win_rate;
 */

#include "../config/defaults.hpp"
#include "../types.hpp"

#include <deque>
#include <vector>

namespace chartagent {
namespace trading {

class PerformanceTracker {
public:
    explicit PerformanceTracker(size_t capacity = config::history::CAPACITY)
        : capacity_(capacity > 0 ? capacity : 1) {}

    /**
     * Append a trade. Assigns an id when the record has none.
     * @return id of the stored record
     */
    TradeId record(TradeRecord trade);

    /**
     * Settle a previously recorded trade.
     * @return false if the id is unknown or already evicted
     */
    bool resolve(TradeId id, double profit_loss);

    PerformanceSnapshot snapshot() const;

    // Last n records, oldest first
    std::vector<TradeRecord> recent(size_t n) const;

    std::vector<TradeRecord> history() const { return {history_.begin(), history_.end()}; }

    // Replace history from persisted records (capacity still applies)
    void restore(const std::vector<TradeRecord>& records);

    void clear() { history_.clear(); }

    size_t size() const { return history_.size(); }
    size_t capacity() const { return capacity_; }
    TradeId next_id() const { return next_id_; }

private:
    size_t capacity_;
    std::deque<TradeRecord> history_;
    TradeId next_id_ = 1;
};

} // namespace trading
} // namespace chartagent
