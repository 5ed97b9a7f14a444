#include "../../include/core/trading_cycle.hpp"
#include "../../include/util/time_utils.hpp"

#include <cmath>

namespace chartagent::core {

TradingCycle::TradingCycle(CycleServices services, CycleSettings settings, risk::RiskPolicy policy,
                           logging::AsyncLogger* logger)
    : services_(services), settings_(std::move(settings)), extractor_(settings_.instrument, logger),
      aggregator_(strategy::SignalAggregator::with_default_strategies(logger)), risk_(policy, logger),
      tracker_(settings_.history_capacity), logger_(logger) {}

double TradingCycle::scaled_lot_size(double base_lots, double multiplier) {
    constexpr double LOT_STEP = 0.01;
    double lots = std::floor(base_lots * multiplier / LOT_STEP + 1e-9) * LOT_STEP;
    return lots < LOT_STEP ? LOT_STEP : lots;
}

CycleReport TradingCycle::fail(CycleReport report, const char* stage, ServiceError error) const {
    report.outcome = CycleOutcome::Failed;
    report.stage = stage;
    report.error = std::move(error);
    CA_LOGF(logger_, Warn, System, "Cycle failed at %s [%s]: %s", stage,
            error_category_to_string(report.error.category), report.error.message.c_str());
    return report;
}

size_t TradingCycle::apply_settlements(const MarketSnapshot& snapshot) {
    size_t applied = 0;
    for (const auto& s : services_.executor->settle(snapshot)) {
        if (tracker_.resolve(s.trade_id, s.profit_loss)) {
            ++applied;
            CA_LOGF(logger_, Info, Performance, "Trade %lu settled (%s): P/L %.2f",
                    static_cast<unsigned long>(s.trade_id), s.reason.c_str(), s.profit_loss);
        }
    }
    return applied;
}

CycleReport TradingCycle::run() {
    CycleReport report;
    uint64_t start = util::now_ns();

    // Capture
    auto capture = services_.perception->capture();
    if (!capture.success) return fail(std::move(report), "capture", capture.error);

    // Parse
    auto parsed = services_.parser->parse(capture.image, settings_.parse_options);
    if (!parsed.success) return fail(std::move(report), "parse", parsed.error);

    // Validate
    if (parsed.elements.size() < settings_.min_parsed_elements) {
        report.outcome = CycleOutcome::InsufficientData;
        report.stage = "validate";
        CA_LOGF(logger_, Info, Perception, "Only %zu parsed elements, skipping cycle", parsed.elements.size());
        return report;
    }

    MarketSnapshot snapshot = extractor_.extract(parsed.elements);
    if (!snapshot.has_price_data()) {
        report.outcome = CycleOutcome::InsufficientData;
        report.stage = "extract";
        CA_LOGF(logger_, Info, Perception, "No price levels in %zu elements, skipping cycle", snapshot.element_count);
        return report;
    }

    // Close out paper/venue trades before the new decision sees the metrics
    report.settlements = apply_settlements(snapshot);

    // Signals
    auto signals = aggregator_.aggregate(snapshot);
    Consensus consensus = strategy::SignalAggregator::build_consensus(signals);

    // Oracle
    oracle::OracleRequest request;
    request.snapshot = snapshot;
    request.signals = signals;
    request.consensus = consensus;
    request.recent_trades = tracker_.recent(settings_.oracle_context);
    request.performance = tracker_.snapshot();

    auto answer = services_.oracle->decide(request);
    if (!answer.success) return fail(std::move(report), "oracle", answer.error);

    // Risk
    Decision decision =
        risk_.adjust(answer.decision, request.performance, tracker_.recent(settings_.risk_lookback), snapshot);
    report.decision = decision;

    if (!decision.is_open()) {
        report.outcome = CycleOutcome::Held;
        report.duration_ns = util::now_ns() - start;
        CA_LOGF(logger_, Info, System, "Hold (conf %.2f): %s", decision.confidence,
                decision.reasoning.empty() ? "-" : decision.reasoning.back().c_str());
        return report;
    }

    // Execute
    execution::ExecutionRequest order;
    order.trade_id = tracker_.next_id();
    order.instrument = snapshot.instrument;
    order.direction = decision.direction;
    order.lot_size = scaled_lot_size(settings_.lot_size, decision.position_size_multiplier);
    order.stop_loss_distance = decision.stop_loss_distance;
    order.take_profit_distance = decision.take_profit_distance;
    order.reference_price = snapshot.reference_price();
    order.confidence = decision.confidence;

    auto fill = services_.executor->execute(order);
    if (!fill.success) return fail(std::move(report), "execute", fill.error);

    // Record
    TradeRecord trade;
    trade.id = order.trade_id;
    trade.timestamp = util::wall_clock_ns();
    trade.decision = decision;
    trade.execution = fill.result;
    trade.profit_loss = fill.result.profit_loss;
    trade.strategies_triggered = consensus.triggered;
    trade.spatial = perception::summarize_spatial(parsed.elements);

    report.trade_id = tracker_.record(std::move(trade));
    report.execution = fill.result;
    report.outcome = CycleOutcome::Executed;
    report.duration_ns = util::now_ns() - start;

    CA_LOGF(logger_, Info, Execution, "Opened %s %.2f lots %s (conf %.2f, size x%.2f) as trade %lu",
            direction_to_string(order.direction), order.lot_size, order.instrument.c_str(), decision.confidence,
            decision.position_size_multiplier, static_cast<unsigned long>(report.trade_id));
    return report;
}

} // namespace chartagent::core
