/**
 * Service client tests
 *
 * Covers request building and response decoding of the HTTP-backed clients
 * without a network, plus the offline collaborators (file capture, rule
 * oracle, paper executor).
 */

#include "../include/execution/paper_trade_executor.hpp"
#include "../include/execution/rest_trade_executor.hpp"
#include "../include/net/http_client.hpp"
#include "../include/oracle/llm_decision_client.hpp"
#include "../include/oracle/rule_based_oracle.hpp"
#include "../include/perception/omniparser_client.hpp"
#include "../include/perception/perception_source.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace chartagent;
using json = nlohmann::json;

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

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// =============================================================================
// Perception
// =============================================================================

TEST(file_source_missing_is_transient) {
    perception::FilePerceptionSource source("/nonexistent/chart.png");
    auto r = source.capture();

    ASSERT_FALSE(r.success);
    ASSERT_EQ(r.error.category, ErrorCategory::Transient);
}

TEST(file_source_reads_bytes) {
    auto path = (std::filesystem::temp_directory_path() / "chartagent_capture.jpg").string();
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "\xFF\xD8\xFF";
    }

    perception::FilePerceptionSource source(path);
    auto r = source.capture();
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.image.bytes.size(), 3u);
    ASSERT_EQ(r.image.mime_type, "image/jpeg");

    { std::ofstream truncate(path, std::ios::trunc); }
    ASSERT_FALSE(source.capture().success);
}

TEST(omniparser_decodes_elements) {
    std::string body = R"({"parsed_content_list": [
        {"type": "text", "content": "RSI: 28.5", "bbox": [0.1, 0.8, 0.2, 0.85]},
        {"type": "icon", "content": "hammer"},
        {"type": "text", "content": ""},
        {"type": "text", "content": "Price: 1.0850", "bbox": [0.9, 0.4, "x", 0.45]},
        "garbage"
    ]})";

    perception::ParseResponse response;
    ASSERT_TRUE(perception::OmniParserClient::parse_response_body(body, response));
    ASSERT_EQ(response.elements.size(), 3u);

    ASSERT_EQ(response.elements[0].text, "RSI: 28.5");
    ASSERT_EQ(response.elements[0].kind, ElementKind::Text);
    ASSERT_NEAR(response.elements[0].bounding_box->y2, 0.85, 1e-12);

    ASSERT_EQ(response.elements[1].kind, ElementKind::Icon);
    ASSERT_FALSE(response.elements[1].bounding_box.has_value());
    ASSERT_FALSE(response.elements[2].bounding_box.has_value());
}

TEST(omniparser_rejects_unexpected_body) {
    perception::ParseResponse response;
    ASSERT_FALSE(perception::OmniParserClient::parse_response_body("<html>502</html>", response));
    ASSERT_FALSE(perception::OmniParserClient::parse_response_body(R"({"detail": "busy"})", response));
}

TEST(omniparser_endpoint_trims_slash) {
    perception::OmniParserClient client("http://localhost:8000/", 1000);
    ASSERT_EQ(client.endpoint(), "http://localhost:8000/parse/");
}

// =============================================================================
// HTTP classification
// =============================================================================

TEST(http_failure_classification) {
    using net::HttpClient;
    ASSERT_EQ(HttpClient::classify_http_failure(401, "").category, ErrorCategory::CredentialInvalid);
    ASSERT_EQ(HttpClient::classify_http_failure(403, "forbidden").category, ErrorCategory::CredentialInvalid);
    ASSERT_EQ(HttpClient::classify_http_failure(504, "").category, ErrorCategory::Timeout);
    ASSERT_EQ(HttpClient::classify_http_failure(500, "").category, ErrorCategory::Transient);
    ASSERT_EQ(HttpClient::classify_http_failure(400, "Account balance too low").category,
              ErrorCategory::BalanceInsufficient);
    ASSERT_EQ(HttpClient::classify_http_failure(502, "upstream timeout").category, ErrorCategory::Transient);

    auto err = HttpClient::classify_http_failure(503, "maintenance");
    ASSERT_TRUE(contains(err.message, "503"));
    ASSERT_TRUE(contains(err.message, "maintenance"));
}

// =============================================================================
// LLM oracle
// =============================================================================

static oracle::OracleRequest sample_request() {
    oracle::OracleRequest req;
    req.snapshot.instrument = "EURUSD";
    req.snapshot.indicators["rsi"] = 27.5;
    req.snapshot.price_levels["price"] = 1.08512;
    req.snapshot.patterns = {"hammer"};
    req.signals = {StrategySignal{"mean_reversion", Direction::Buy, 0.1},
                   StrategySignal::none("breakout")};
    req.consensus.direction = Direction::Buy;
    req.consensus.buy_votes = 1;

    TradeRecord t;
    t.decision = Decision::open(Direction::Sell, 0.7);
    t.profit_loss = -4.2;
    req.recent_trades = {t};
    req.performance.win_rate = 55.0;
    req.performance.total_trades = 20;
    return req;
}

TEST(llm_prompt_includes_context) {
    std::string prompt = oracle::LlmDecisionClient::build_prompt(sample_request());

    ASSERT_TRUE(contains(prompt, "EURUSD"));
    ASSERT_TRUE(contains(prompt, "rsi: 27.5000"));
    ASSERT_TRUE(contains(prompt, "price: 1.08512"));
    ASSERT_TRUE(contains(prompt, "hammer"));
    ASSERT_TRUE(contains(prompt, "mean_reversion: buy"));
    ASSERT_TRUE(contains(prompt, "breakout: none"));
    ASSERT_TRUE(contains(prompt, "Win rate: 55.0% over 20 trades"));
    ASSERT_TRUE(contains(prompt, "result=-4.20"));
    ASSERT_TRUE(contains(prompt, "\"action\""));
}

TEST(llm_request_json_shape) {
    oracle::LlmClientConfig cfg;
    cfg.model = "gpt-4o-mini";
    cfg.api_key = "sk-test";
    oracle::LlmDecisionClient client(cfg);

    json req = json::parse(client.build_request_json("hello"));
    ASSERT_EQ(req["model"], "gpt-4o-mini");
    ASSERT_EQ(req["max_tokens"], 500);
    ASSERT_EQ(req["response_format"]["type"], "json_object");
    ASSERT_EQ(req["messages"].size(), 2u);
    ASSERT_EQ(req["messages"][0]["role"], "system");
    ASSERT_EQ(req["messages"][1]["content"], "hello");
}

TEST(llm_extracts_message_content) {
    std::string content;
    ASSERT_TRUE(oracle::LlmDecisionClient::extract_message_content(
        R"({"choices": [{"message": {"role": "assistant", "content": "{\"action\": \"hold\"}"}}]})", content));
    ASSERT_EQ(content, "{\"action\": \"hold\"}");

    ASSERT_FALSE(oracle::LlmDecisionClient::extract_message_content(R"({"choices": []})", content));
    ASSERT_FALSE(oracle::LlmDecisionClient::extract_message_content(R"({"error": {"message": "x"}})", content));
    ASSERT_FALSE(oracle::LlmDecisionClient::extract_message_content("not json", content));
}

TEST(llm_without_key_is_fatal) {
    oracle::LlmDecisionClient client(oracle::LlmClientConfig{});
    ASSERT_FALSE(client.is_valid());

    auto r = client.decide(sample_request());
    ASSERT_FALSE(r.success);
    ASSERT_EQ(r.error.category, ErrorCategory::CredentialInvalid);
    ASSERT_TRUE(r.error.is_fatal());
}

// =============================================================================
// Rule-based oracle
// =============================================================================

TEST(rule_oracle_follows_consensus) {
    oracle::RuleBasedOracle rules;
    auto req = sample_request();
    req.consensus.direction = Direction::Sell;
    req.consensus.sell_votes = 3;
    req.consensus.buy_votes = 1;
    req.consensus.strength = 0.65;
    req.consensus.triggered = {"trend_following", "breakout", "confirmation", "mean_reversion"};

    auto r = rules.decide(req);
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.decision.action, Action::Open);
    ASSERT_EQ(r.decision.direction, Direction::Sell);
    ASSERT_NEAR(r.decision.confidence, 0.65, 1e-12);
    ASSERT_TRUE(contains(r.decision.reasoning[0], "trend_following"));
}

TEST(rule_oracle_holds_on_tie_or_weak) {
    oracle::RuleBasedOracle rules(0.5);
    auto req = sample_request();

    req.consensus = Consensus{};
    req.consensus.buy_votes = 1;
    req.consensus.sell_votes = 1;
    auto tie = rules.decide(req);
    ASSERT_EQ(tie.decision.action, Action::Hold);
    ASSERT_EQ(tie.decision.reasoning[0], "Strategies split evenly");

    req.consensus = Consensus{};
    ASSERT_EQ(rules.decide(req).decision.reasoning[0], "No strategy signal");

    req.consensus.direction = Direction::Buy;
    req.consensus.buy_votes = 1;
    req.consensus.strength = 0.3;
    auto weak = rules.decide(req);
    ASSERT_EQ(weak.decision.action, Action::Hold);
    ASSERT_EQ(weak.decision.direction, Direction::None);
}

// =============================================================================
// Execution
// =============================================================================

static execution::ExecutionRequest sample_order() {
    execution::ExecutionRequest req;
    req.trade_id = 12;
    req.instrument = "EURUSD";
    req.direction = Direction::Buy;
    req.lot_size = 0.02;
    req.stop_loss_distance = 0.0020;
    req.take_profit_distance = 0.0040;
    req.reference_price = 1.1000;
    req.confidence = 0.8;
    return req;
}

TEST(rest_order_json) {
    json order = json::parse(execution::RestTradeExecutor::build_order_json(sample_order()));
    ASSERT_EQ(order["client_order_id"], "agent-12");
    ASSERT_EQ(order["side"], "buy");
    ASSERT_EQ(order["lots"], 0.02);
    ASSERT_EQ(order["stop_loss_distance"], 0.0020);

    auto bare = sample_order();
    bare.stop_loss_distance.reset();
    bare.take_profit_distance.reset();
    order = json::parse(execution::RestTradeExecutor::build_order_json(bare));
    ASSERT_FALSE(order.contains("stop_loss_distance"));
    ASSERT_FALSE(order.contains("take_profit_distance"));
}

TEST(rest_order_response) {
    auto req = sample_order();

    execution::ExecutionResponse ok;
    ASSERT_TRUE(execution::RestTradeExecutor::parse_order_response(
        R"({"order_id": 98765, "fill_price": 1.10012, "status": "filled"})", req, ok));
    ASSERT_TRUE(ok.success);
    ASSERT_EQ(ok.result.order_id, "98765");
    ASSERT_NEAR(*ok.result.fill_price, 1.10012, 1e-12);
    ASSERT_EQ(ok.result.message, "filled");
    ASSERT_EQ(ok.result.direction, Direction::Buy);

    execution::ExecutionResponse broke;
    ASSERT_FALSE(execution::RestTradeExecutor::parse_order_response(
        R"({"error": "Account balance too low"})", req, broke));
    ASSERT_EQ(broke.error.category, ErrorCategory::BalanceInsufficient);

    execution::ExecutionResponse lost;
    ASSERT_FALSE(execution::RestTradeExecutor::parse_order_response(
        R"({"error": "Connection to broker lost"})", req, lost));
    ASSERT_EQ(lost.error.category, ErrorCategory::ConnectivityLost);

    execution::ExecutionResponse odd;
    ASSERT_FALSE(execution::RestTradeExecutor::parse_order_response(R"({"status": "ok"})", req, odd));
    ASSERT_EQ(odd.error.category, ErrorCategory::Transient);
}

TEST(rest_without_key_is_fatal) {
    execution::RestTradeExecutor rest("http://localhost:8080/api/", "");
    auto r = rest.execute(sample_order());
    ASSERT_FALSE(r.success);
    ASSERT_EQ(r.error.category, ErrorCategory::CredentialInvalid);
}

TEST(paper_fill_and_settle) {
    execution::PaperTradeExecutor paper(1000.0);
    auto r = paper.execute(sample_order());
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.result.order_id, "paper-1");
    ASSERT_NEAR(*r.result.fill_price, 1.1000, 1e-12);
    ASSERT_EQ(paper.open_positions().size(), 1u);

    MarketSnapshot snap;
    snap.instrument = "EURUSD";
    snap.price_levels["price"] = 1.1010; // Between stop and target
    ASSERT_TRUE(paper.settle(snap).empty());

    snap.price_levels["price"] = 1.0975; // Through the stop at 1.0980
    auto settled = paper.settle(snap);
    ASSERT_EQ(settled.size(), 1u);
    ASSERT_EQ(settled[0].trade_id, 12u);
    ASSERT_EQ(settled[0].reason, "stop_loss");
    ASSERT_NEAR(settled[0].profit_loss, -4.0, 1e-6); // 20 pips on 0.02 lots
    ASSERT_NEAR(paper.balance(), 996.0, 1e-6);
    ASSERT_TRUE(paper.open_positions().empty());
}

TEST(paper_rejects_bad_orders) {
    execution::PaperTradeExecutor paper(1000.0);

    auto no_price = sample_order();
    no_price.reference_price.reset();
    ASSERT_EQ(paper.execute(no_price).error.category, ErrorCategory::Transient);

    auto no_dir = sample_order();
    no_dir.direction = Direction::None;
    ASSERT_FALSE(paper.execute(no_dir).success);

    execution::PaperTradeExecutor broke(0.0);
    auto r = broke.execute(sample_order());
    ASSERT_EQ(r.error.category, ErrorCategory::BalanceInsufficient);
}

int main() {
    std::cout << "\n=== Service Client Tests ===\n\n";

    RUN_TEST(file_source_missing_is_transient);
    RUN_TEST(file_source_reads_bytes);
    RUN_TEST(omniparser_decodes_elements);
    RUN_TEST(omniparser_rejects_unexpected_body);
    RUN_TEST(omniparser_endpoint_trims_slash);
    RUN_TEST(http_failure_classification);
    RUN_TEST(llm_prompt_includes_context);
    RUN_TEST(llm_request_json_shape);
    RUN_TEST(llm_extracts_message_content);
    RUN_TEST(llm_without_key_is_fatal);
    RUN_TEST(rule_oracle_follows_consensus);
    RUN_TEST(rule_oracle_holds_on_tie_or_weak);
    RUN_TEST(rest_order_json);
    RUN_TEST(rest_order_response);
    RUN_TEST(rest_without_key_is_fatal);
    RUN_TEST(paper_fill_and_settle);
    RUN_TEST(paper_rejects_bad_orders);

    std::cout << "\n=== All Service Client Tests Passed! ===\n";
    return 0;
}
