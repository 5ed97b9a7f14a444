#include "../../include/oracle/decision_parser.hpp"
#include "../../include/config/defaults.hpp"
#include "../../include/util/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>

namespace chartagent::oracle {

using json = nlohmann::json;

namespace {

enum class ActionKind { Unknown, Hold, Buy, Sell };

ActionKind read_action(const json& data) {
    auto read = [](const json& v) -> ActionKind {
        if (!v.is_string()) return ActionKind::Unknown;
        std::string a = util::to_lower(util::trim(v.get<std::string>()));
        if (a == "buy" || a == "long") return ActionKind::Buy;
        if (a == "sell" || a == "short") return ActionKind::Sell;
        if (a == "hold" || a == "wait" || a == "none") return ActionKind::Hold;
        return ActionKind::Unknown;
    };

    if (!data.contains("action")) return ActionKind::Unknown;
    ActionKind kind = read(data["action"]);

    // {"action": "open", "direction": "buy"}
    if (kind == ActionKind::Unknown && data["action"].is_string() &&
        util::to_lower(data["action"].get<std::string>()) == "open" && data.contains("direction")) {
        kind = read(data["direction"]);
        if (kind == ActionKind::Hold) kind = ActionKind::Unknown;
    }
    return kind;
}

double read_confidence(const json& data) {
    if (!data.contains("confidence")) return config::oracle::MISSING_CONFIDENCE;

    const auto& v = data["confidence"];
    double c = config::oracle::MISSING_CONFIDENCE;
    bool percent_sign = false;
    if (v.is_number()) {
        c = v.get<double>();
    } else if (v.is_string()) {
        std::string s = util::trim(v.get<std::string>());
        if (!s.empty() && s.back() == '%') {
            s.pop_back();
            percent_sign = true;
        }
        char* end = nullptr;
        double parsed = std::strtod(s.c_str(), &end);
        if (end == s.c_str()) return config::oracle::MISSING_CONFIDENCE;
        c = parsed;
    } else {
        return config::oracle::MISSING_CONFIDENCE;
    }

    if (!std::isfinite(c)) return config::oracle::MISSING_CONFIDENCE;
    // Slightly above 1 is an overshoot, not 1.2%
    if (percent_sign || c > config::oracle::PERCENT_FORM_ABOVE) c /= 100.0;
    if (c < 0) c = 0;
    if (c > 1) c = 1;
    return c;
}

std::vector<std::string> read_reasoning(const json& data) {
    std::vector<std::string> out;
    const char* key = data.contains("reasoning") ? "reasoning" : (data.contains("reason") ? "reason" : nullptr);
    if (!key) return out;

    const auto& v = data[key];
    if (v.is_string()) {
        std::string s = util::trim(v.get<std::string>());
        if (!s.empty()) out.push_back(s);
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                out.push_back(item.get<std::string>());
            }
        }
    }
    return out;
}

std::optional<double> read_positive(const json& data, const char* key) {
    if (!data.contains(key) || !data[key].is_number()) return std::nullopt;
    double v = data[key].get<double>();
    if (!std::isfinite(v) || v <= 0) return std::nullopt;
    return v;
}

} // namespace

std::string strip_code_fences(const std::string& text) {
    std::string t = util::trim(text);
    if (t.rfind("```", 0) != 0) return t;

    size_t first_newline = t.find('\n');
    if (first_newline == std::string::npos) return t;

    size_t closing = t.rfind("```");
    if (closing == std::string::npos || closing <= first_newline) {
        return util::trim(t.substr(first_newline + 1));
    }
    return util::trim(t.substr(first_newline + 1, closing - first_newline - 1));
}

ProposalParseResult parse_proposal(const std::string& text) {
    ProposalParseResult result;

    std::string body = strip_code_fences(text);
    size_t json_start = body.find('{');
    size_t json_end = body.rfind('}');
    if (json_start == std::string::npos || json_end == std::string::npos || json_end < json_start) {
        result.error = "No JSON object in reply";
        return result;
    }

    try {
        json data = json::parse(body.substr(json_start, json_end - json_start + 1));
        if (!data.is_object()) {
            result.error = "Reply is not a JSON object";
            return result;
        }

        ActionKind action = read_action(data);
        if (action == ActionKind::Unknown) {
            result.error = "Missing or unrecognized action";
            return result;
        }

        double confidence = read_confidence(data);
        auto reasoning = read_reasoning(data);

        if (action == ActionKind::Hold) {
            result.proposal = HoldProposal{confidence, std::move(reasoning)};
        } else {
            OpenProposal open;
            open.direction = action == ActionKind::Buy ? Direction::Buy : Direction::Sell;
            open.confidence = confidence;
            open.reasoning = std::move(reasoning);
            open.stop_loss_distance = read_positive(data, "stop_loss_distance");
            open.take_profit_distance = read_positive(data, "take_profit_distance");
            result.proposal = std::move(open);
        }
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }
    return result;
}

Decision to_decision(const OracleProposal& proposal) {
    if (const auto* open = std::get_if<OpenProposal>(&proposal)) {
        Decision d = Decision::open(open->direction, open->confidence, open->reasoning);
        d.stop_loss_distance = open->stop_loss_distance;
        d.take_profit_distance = open->take_profit_distance;
        return d;
    }

    const auto& hold = std::get<HoldProposal>(proposal);
    Decision d = Decision::hold("", hold.confidence);
    d.reasoning = hold.reasoning;
    return d;
}

Decision decision_from_reply(const std::string& text, bool& malformed) {
    auto parsed = parse_proposal(text);
    if (!parsed.proposal) {
        malformed = true;
        return Decision::hold("Oracle reply unusable: " + parsed.error, 0.0);
    }
    malformed = false;
    return to_decision(*parsed.proposal);
}

} // namespace chartagent::oracle
