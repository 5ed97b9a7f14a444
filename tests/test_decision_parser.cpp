#include "../include/oracle/decision_parser.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace chartagent;
using namespace chartagent::oracle;

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

static Decision decide(const std::string& reply, bool& malformed) {
    return decision_from_reply(reply, malformed);
}

TEST(bare_action_defaults_confidence) {
    bool malformed = true;
    auto d = decide(R"({"action": "buy"})", malformed);

    ASSERT_FALSE(malformed);
    ASSERT_EQ(d.action, Action::Open);
    ASSERT_EQ(d.direction, Direction::Buy);
    ASSERT_NEAR(d.confidence, 0.5, 1e-12);
    ASSERT_TRUE(d.reasoning.empty());
}

TEST(percent_confidence_is_scaled) {
    bool malformed = true;
    auto d = decide(R"({"action": "SELL", "confidence": 80})", malformed);
    ASSERT_EQ(d.direction, Direction::Sell);
    ASSERT_NEAR(d.confidence, 0.8, 1e-12);

    d = decide(R"({"action": "sell", "confidence": "75%"})", malformed);
    ASSERT_NEAR(d.confidence, 0.75, 1e-12);

    d = decide(R"({"action": "sell", "confidence": 0.65})", malformed);
    ASSERT_NEAR(d.confidence, 0.65, 1e-12);

    d = decide(R"({"action": "sell", "confidence": -2})", malformed);
    ASSERT_EQ(d.confidence, 0.0);

    d = decide(R"({"action": "sell", "confidence": 450})", malformed);
    ASSERT_EQ(d.confidence, 1.0);

    d = decide(R"({"action": "sell", "confidence": "1%"})", malformed);
    ASSERT_NEAR(d.confidence, 0.01, 1e-12);
}

TEST(confidence_just_above_one_clamps) {
    bool malformed = false;
    auto d = decide(R"({"action": "buy", "confidence": 1.5})", malformed);
    ASSERT_FALSE(malformed);
    ASSERT_EQ(d.confidence, 1.0);

    d = decide(R"({"action": "buy", "confidence": 1.05})", malformed);
    ASSERT_EQ(d.confidence, 1.0);

    d = decide(R"({"action": "buy", "confidence": 1})", malformed);
    ASSERT_EQ(d.confidence, 1.0);

    d = decide(R"({"action": "buy", "confidence": 2})", malformed);
    ASSERT_NEAR(d.confidence, 0.02, 1e-12);
}

TEST(reasoning_string_or_list) {
    bool malformed = true;
    auto d = decide(R"({"action": "hold", "reasoning": "  flat market "})", malformed);
    ASSERT_EQ(d.reasoning.size(), 1u);
    ASSERT_EQ(d.reasoning[0], "flat market");

    d = decide(R"({"action": "buy", "reasoning": ["rsi low", "", "hammer"]})", malformed);
    ASSERT_EQ(d.reasoning.size(), 2u);
    ASSERT_EQ(d.reasoning[1], "hammer");

    d = decide(R"({"action": "buy", "reason": "breakout"})", malformed);
    ASSERT_EQ(d.reasoning.size(), 1u);
}

TEST(code_fences_are_stripped) {
    ASSERT_EQ(strip_code_fences("```json\n{\"a\":1}\n```"), "{\"a\":1}");
    ASSERT_EQ(strip_code_fences("```\n{}\n```"), "{}");
    ASSERT_EQ(strip_code_fences("  {\"x\":2} "), "{\"x\":2}");

    bool malformed = true;
    auto d = decide("```json\n{\"action\": \"buy\", \"confidence\": 0.9}\n```", malformed);
    ASSERT_FALSE(malformed);
    ASSERT_NEAR(d.confidence, 0.9, 1e-12);
}

TEST(prose_around_object_is_ignored) {
    bool malformed = true;
    auto d = decide("Here is my answer: {\"action\": \"short\"} Good luck.", malformed);
    ASSERT_FALSE(malformed);
    ASSERT_EQ(d.direction, Direction::Sell);
}

TEST(hold_never_has_direction) {
    bool malformed = true;
    auto d = decide(R"({"action": "wait", "direction": "buy", "confidence": 0.4})", malformed);

    ASSERT_FALSE(malformed);
    ASSERT_EQ(d.action, Action::Hold);
    ASSERT_EQ(d.direction, Direction::None);
    ASSERT_NEAR(d.confidence, 0.4, 1e-12);
}

TEST(open_with_direction_field) {
    bool malformed = true;
    auto d = decide(R"({"action": "open", "direction": "long"})", malformed);
    ASSERT_FALSE(malformed);
    ASSERT_EQ(d.direction, Direction::Buy);

    d = decide(R"({"action": "open", "direction": "hold"})", malformed);
    ASSERT_TRUE(malformed);

    d = decide(R"({"action": "open"})", malformed);
    ASSERT_TRUE(malformed);
}

TEST(unusable_reply_becomes_hold) {
    bool malformed = false;
    auto d = decide(R"({"decision": "maybe"})", malformed);
    ASSERT_TRUE(malformed);
    ASSERT_EQ(d.action, Action::Hold);
    ASSERT_EQ(d.confidence, 0.0);
    ASSERT_EQ(d.reasoning.size(), 1u);
    ASSERT_EQ(d.reasoning[0].rfind("Oracle reply unusable", 0), 0u);

    malformed = false;
    d = decide("I would buy here", malformed);
    ASSERT_TRUE(malformed);
    ASSERT_EQ(d.direction, Direction::None);

    malformed = false;
    d = decide("{\"action\": \"buy\",", malformed);
    ASSERT_TRUE(malformed);
}

TEST(stop_distances_are_optional) {
    auto parsed = parse_proposal(
        R"({"action": "buy", "stop_loss_distance": 0.0025, "take_profit_distance": -1})");
    ASSERT_TRUE(parsed.proposal.has_value());
    ASSERT_TRUE(std::holds_alternative<OpenProposal>(*parsed.proposal));

    const auto& open = std::get<OpenProposal>(*parsed.proposal);
    ASSERT_NEAR(*open.stop_loss_distance, 0.0025, 1e-12);
    ASSERT_FALSE(open.take_profit_distance.has_value());

    auto d = to_decision(*parsed.proposal);
    ASSERT_NEAR(*d.stop_loss_distance, 0.0025, 1e-12);
    ASSERT_FALSE(d.take_profit_distance.has_value());
}

TEST(parse_failure_reports_error) {
    auto parsed = parse_proposal("no json at all");
    ASSERT_FALSE(parsed.proposal.has_value());
    ASSERT_FALSE(parsed.error.empty());

    parsed = parse_proposal(R"({"action": "hold"})");
    ASSERT_TRUE(std::holds_alternative<HoldProposal>(*parsed.proposal));
    ASSERT_TRUE(parsed.error.empty());
}

int main() {
    std::cout << "\n=== Decision Parser Tests ===\n\n";

    RUN_TEST(bare_action_defaults_confidence);
    RUN_TEST(percent_confidence_is_scaled);
    RUN_TEST(confidence_just_above_one_clamps);
    RUN_TEST(reasoning_string_or_list);
    RUN_TEST(code_fences_are_stripped);
    RUN_TEST(prose_around_object_is_ignored);
    RUN_TEST(hold_never_has_direction);
    RUN_TEST(open_with_direction_field);
    RUN_TEST(unusable_reply_becomes_hold);
    RUN_TEST(stop_distances_are_optional);
    RUN_TEST(parse_failure_reports_error);

    std::cout << "\n=== All Decision Parser Tests Passed! ===\n";
    return 0;
}
