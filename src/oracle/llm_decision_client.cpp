#include "../../include/oracle/llm_decision_client.hpp"
#include "../../include/oracle/decision_parser.hpp"
#include "../../include/safety/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace chartagent::oracle {

using json = nlohmann::json;

namespace {

constexpr const char* SYSTEM_PROMPT =
    "You are a forex trading assistant. You receive indicators read from a chart screenshot, "
    "the votes of several rule-based strategies and the agent's recent results. "
    "Reply with a single JSON object and nothing else.";

} // namespace

LlmDecisionClient::LlmDecisionClient(LlmClientConfig config, logging::AsyncLogger* logger)
    : config_(std::move(config)), http_(config_.timeout_ms), logger_(logger) {}

OracleResponse LlmDecisionClient::decide(const OracleRequest& request) {
    OracleResponse response;

    if (config_.api_key.empty()) {
        response.error = ServiceError{ErrorCategory::CredentialInvalid, "API key invalid: no OpenAI API key configured"};
        return response;
    }

    std::string body = build_request_json(build_prompt(request));
    auto http = http_.post_json(config_.url, body, {"Authorization: Bearer " + config_.api_key});

    if (!http.success) {
        response.error = http.error;
        CA_LOGF(logger_, Warn, Oracle, "Oracle request failed: %s", http.error.message.c_str());
        return response;
    }

    std::string content;
    if (!extract_message_content(http.body, content)) {
        // Provider-side error objects arrive with 200 on some gateways
        ErrorCategory category = safety::classify_error_message(http.body);
        if (category != ErrorCategory::Transient && category != ErrorCategory::Timeout) {
            response.error = ServiceError{category, "Oracle error: " + http.body.substr(0, 200)};
            return response;
        }
        content.clear();
    }

    response.raw_response = content;
    response.decision = decision_from_reply(content, response.malformed);
    response.success = true;

    if (response.malformed) {
        CA_LOGF(logger_, Warn, Oracle, "Malformed oracle reply, holding: %.120s", content.c_str());
    } else {
        CA_LOGF(logger_, Info, Oracle, "Oracle: %s %s conf=%.2f (%u ms)", action_to_string(response.decision.action),
                direction_to_string(response.decision.direction), response.decision.confidence, http.latency_ms);
    }
    return response;
}

std::string LlmDecisionClient::build_prompt(const OracleRequest& request) {
    std::ostringstream ss;
    ss << std::fixed;

    const auto& snap = request.snapshot;
    ss << "## Market: " << snap.instrument << "\n";

    ss << "Indicators:\n";
    if (snap.indicators.empty()) ss << "- (none)\n";
    for (const auto& [key, value] : snap.indicators) {
        ss << "- " << key << ": " << std::setprecision(4) << value << "\n";
    }

    ss << "Price levels:\n";
    for (const auto& [key, value] : snap.price_levels) {
        ss << "- " << key << ": " << std::setprecision(5) << value << "\n";
    }

    ss << "Candlestick patterns: ";
    if (snap.patterns.empty()) ss << "(none)";
    bool first = true;
    for (const auto& p : snap.patterns) {
        ss << (first ? "" : ", ") << p;
        first = false;
    }
    ss << "\n\n";

    ss << "## Strategy signals\n";
    for (const auto& s : request.signals) {
        ss << "- " << s.strategy_name << ": " << direction_to_string(s.direction);
        if (s.fired()) ss << " (strength " << std::setprecision(2) << s.strength << ")";
        ss << "\n";
    }
    ss << "Consensus: " << direction_to_string(request.consensus.direction) << " (" << request.consensus.buy_votes
       << " buy / " << request.consensus.sell_votes << " sell)\n\n";

    const auto& perf = request.performance;
    ss << "## Performance\n";
    ss << "- Win rate: " << std::setprecision(1) << perf.win_rate << "% over " << perf.total_trades << " trades\n";
    ss << "- Cumulative P/L: " << std::setprecision(2) << perf.cumulative_profit_loss << "\n";
    ss << "- Consecutive losses: " << perf.consecutive_losses << "\n\n";

    ss << "## Recent trades (oldest first)\n";
    if (request.recent_trades.empty()) ss << "- (none)\n";
    for (const auto& t : request.recent_trades) {
        ss << "- " << action_to_string(t.decision.action) << " " << direction_to_string(t.decision.direction)
           << " conf=" << std::setprecision(2) << t.decision.confidence << " result=";
        if (t.profit_loss) {
            ss << std::setprecision(2) << *t.profit_loss;
        } else {
            ss << "open";
        }
        ss << "\n";
    }

    ss << "\n## Task\n";
    ss << "Decide whether to buy, sell or hold. Respond ONLY with JSON:\n";
    ss << R"({"action": "buy|sell|hold", "confidence": 0.0-1.0, "reasoning": ["..."]})";
    ss << "\n";
    return ss.str();
}

std::string LlmDecisionClient::build_request_json(const std::string& prompt) const {
    json request = {
        {"model", config_.model},
        {"temperature", config_.temperature},
        {"max_tokens", config_.max_tokens},
        {"response_format", {{"type", "json_object"}}},
        {"messages",
         json::array({
             {{"role", "system"}, {"content", SYSTEM_PROMPT}},
             {{"role", "user"}, {"content", prompt}},
         })},
    };
    return request.dump();
}

bool LlmDecisionClient::extract_message_content(const std::string& body, std::string& content) {
    try {
        json data = json::parse(body);
        if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) {
            return false;
        }
        const auto& message = data["choices"][0].value("message", json::object());
        if (!message.contains("content") || !message["content"].is_string()) {
            return false;
        }
        content = message["content"].get<std::string>();
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

} // namespace chartagent::oracle
