#include "../../include/state/state_store.hpp"
#include "../../include/util/time_utils.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace chartagent::state {

namespace {

constexpr int STATE_VERSION = 1;

json optional_number(const std::optional<double>& v) { return v ? json(*v) : json(nullptr); }

std::optional<double> read_optional(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    return j[key].get<double>();
}

json decision_to_json(const Decision& d) {
    return {
        {"action", action_to_string(d.action)},
        {"direction", direction_to_string(d.direction)},
        {"confidence", d.confidence},
        {"reasoning", d.reasoning},
        {"stop_loss_distance", optional_number(d.stop_loss_distance)},
        {"take_profit_distance", optional_number(d.take_profit_distance)},
        {"position_size_multiplier", d.position_size_multiplier},
    };
}

Decision decision_from_json(const json& j) {
    Decision d;
    d.action = j.value("action", std::string("hold")) == "open" ? Action::Open : Action::Hold;
    d.direction = direction_from_string(j.value("direction", std::string("none"))).value_or(Direction::None);
    if (d.action == Action::Hold) d.direction = Direction::None;
    d.confidence = j.value("confidence", 0.0);
    if (j.contains("reasoning") && j["reasoning"].is_array()) {
        for (const auto& r : j["reasoning"]) {
            if (r.is_string()) d.reasoning.push_back(r.get<std::string>());
        }
    }
    d.stop_loss_distance = read_optional(j, "stop_loss_distance");
    d.take_profit_distance = read_optional(j, "take_profit_distance");
    d.position_size_multiplier = j.value("position_size_multiplier", 1.0);
    return d;
}

json execution_to_json(const ExecutionResult& e) {
    return {
        {"success", e.success},
        {"order_id", e.order_id},
        {"direction", direction_to_string(e.direction)},
        {"lot_size", e.lot_size},
        {"fill_price", optional_number(e.fill_price)},
        {"profit_loss", optional_number(e.profit_loss)},
        {"message", e.message},
    };
}

ExecutionResult execution_from_json(const json& j) {
    ExecutionResult e;
    e.success = j.value("success", false);
    e.order_id = j.value("order_id", std::string());
    e.direction = direction_from_string(j.value("direction", std::string("none"))).value_or(Direction::None);
    e.lot_size = j.value("lot_size", 0.0);
    e.fill_price = read_optional(j, "fill_price");
    e.profit_loss = read_optional(j, "profit_loss");
    e.message = j.value("message", std::string());
    return e;
}

} // namespace

// =============================================================================
// Codecs
// =============================================================================

json trade_to_json(const TradeRecord& trade) {
    json j = {
        {"id", trade.id},
        {"timestamp", trade.timestamp},
        {"decision", decision_to_json(trade.decision)},
        {"execution", trade.execution ? execution_to_json(*trade.execution) : json(nullptr)},
        {"profit_loss", optional_number(trade.profit_loss)},
        {"strategies_triggered", trade.strategies_triggered},
        {"spatial",
         {{"top", trade.spatial.top},
          {"middle", trade.spatial.middle},
          {"bottom", trade.spatial.bottom},
          {"unplaced", trade.spatial.unplaced}}},
    };
    return j;
}

TradeRecord trade_from_json(const json& j) {
    TradeRecord t;
    t.id = j.value("id", INVALID_TRADE_ID);
    t.timestamp = j.value("timestamp", Timestamp{0});
    if (j.contains("decision") && j["decision"].is_object()) {
        t.decision = decision_from_json(j["decision"]);
    }
    if (j.contains("execution") && j["execution"].is_object()) {
        t.execution = execution_from_json(j["execution"]);
    }
    t.profit_loss = read_optional(j, "profit_loss");
    if (j.contains("strategies_triggered") && j["strategies_triggered"].is_array()) {
        for (const auto& s : j["strategies_triggered"]) {
            if (s.is_string()) t.strategies_triggered.push_back(s.get<std::string>());
        }
    }
    if (j.contains("spatial") && j["spatial"].is_object()) {
        const auto& s = j["spatial"];
        t.spatial.top = s.value("top", size_t{0});
        t.spatial.middle = s.value("middle", size_t{0});
        t.spatial.bottom = s.value("bottom", size_t{0});
        t.spatial.unplaced = s.value("unplaced", size_t{0});
    }
    return t;
}

json performance_to_json(const PerformanceSnapshot& perf) {
    return {
        {"win_rate", perf.win_rate},
        {"total_trades", perf.total_trades},
        {"cumulative_profit_loss", perf.cumulative_profit_loss},
        {"consecutive_losses", perf.consecutive_losses},
        {"average_profit", perf.average_profit},
        {"average_loss", perf.average_loss},
        {"max_drawdown", perf.max_drawdown},
        {"unresolved_trades", perf.unresolved_trades},
    };
}

PerformanceSnapshot performance_from_json(const json& j) {
    PerformanceSnapshot p;
    p.win_rate = j.value("win_rate", 0.0);
    p.total_trades = j.value("total_trades", 0);
    p.cumulative_profit_loss = j.value("cumulative_profit_loss", 0.0);
    p.consecutive_losses = j.value("consecutive_losses", 0);
    p.average_profit = j.value("average_profit", 0.0);
    p.average_loss = j.value("average_loss", 0.0);
    p.max_drawdown = j.value("max_drawdown", 0.0);
    p.unresolved_trades = j.value("unresolved_trades", 0);
    return p;
}

// =============================================================================
// StateStore
// =============================================================================

bool StateStore::save(const PersistedState& state) const {
    json root = {
        {"version", STATE_VERSION},
        {"running", state.running},
        {"consecutive_errors", state.consecutive_errors},
        {"history", json::array()},
        {"performance", performance_to_json(state.performance)},
    };
    for (const auto& t : state.history) {
        root["history"].push_back(trade_to_json(t));
    }

    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            CA_LOGF(logger_, Error, System, "Cannot write state file %s", tmp_path.c_str());
            return false;
        }
        out << root.dump(2);
        if (!out.good()) {
            CA_LOGF(logger_, Error, System, "Short write to %s", tmp_path.c_str());
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        CA_LOGF(logger_, Error, System, "Cannot replace state file %s", path_.c_str());
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

LoadResult StateStore::load() const {
    LoadResult result;

    std::ifstream in(path_);
    if (!in.is_open()) {
        result.status = LoadStatus::Missing;
        return result;
    }

    try {
        json root = json::parse(in);
        if (!root.is_object()) {
            throw std::runtime_error("state root is not an object");
        }

        result.state.running = root.value("running", false);
        result.state.consecutive_errors = root.value("consecutive_errors", 0);
        if (root.contains("history") && root["history"].is_array()) {
            for (const auto& t : root["history"]) {
                if (t.is_object()) result.state.history.push_back(trade_from_json(t));
            }
        }
        if (root.contains("performance") && root["performance"].is_object()) {
            result.state.performance = performance_from_json(root["performance"]);
        }
        result.status = LoadStatus::Loaded;
    } catch (const std::exception& e) {
        result = LoadResult{};
        result.status = LoadStatus::Corrupt;
        result.error = e.what();
        CA_LOGF(logger_, Warn, System, "State file %s is corrupt, starting empty: %s", path_.c_str(), e.what());
    }
    return result;
}

std::string StateStore::export_history(const std::vector<TradeRecord>& trades, const std::string& directory) const {
    std::string path = directory + "/trade_history_" + util::format_wall_clock(util::wall_clock_ns(), "%Y%m%d_%H%M%S") +
                       ".json";

    json out = json::array();
    for (const auto& t : trades) {
        out.push_back(trade_to_json(t));
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        CA_LOGF(logger_, Error, System, "Cannot export history to %s", path.c_str());
        return "";
    }
    file << out.dump(2);
    if (!file.good()) return "";

    CA_LOGF(logger_, Info, System, "Exported %zu trades to %s", trades.size(), path.c_str());
    return path;
}

} // namespace chartagent::state
