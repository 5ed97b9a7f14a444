#pragma once

/**
 * Oracle reply normalisation
 *
 * Replies are loose JSON written by a language model. They go through a
 * tagged proposal first so every accepted shape lands in one of two
 * well-formed cases before becoming a Decision:
 *
 *   {"action": "buy"}                          -> Open buy, confidence 0.5
 *   {"action": "sell", "confidence": 80}       -> Open sell, confidence 0.8
 *   {"action": "hold", "reasoning": "flat"}    -> Hold
 *   ```json {...} ```                          -> fences stripped first
 *   {"decision": "maybe"} / not JSON           -> parse failure
 */

#include "../types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chartagent {
namespace oracle {

struct HoldProposal {
    double confidence = 0;
    std::vector<std::string> reasoning;
};

struct OpenProposal {
    Direction direction = Direction::None; // Buy or Sell, never None
    double confidence = 0;
    std::vector<std::string> reasoning;
    std::optional<double> stop_loss_distance;
    std::optional<double> take_profit_distance;
};

using OracleProposal = std::variant<HoldProposal, OpenProposal>;

struct ProposalParseResult {
    std::optional<OracleProposal> proposal;
    std::string error; // Set when proposal is empty
};

/**
 * Remove a surrounding ```json ... ``` (or bare ```) fence.
 */
std::string strip_code_fences(const std::string& text);

/**
 * Parse a reply into a proposal. Never throws.
 */
ProposalParseResult parse_proposal(const std::string& text);

Decision to_decision(const OracleProposal& proposal);

/**
 * parse_proposal + to_decision. A parse failure yields a zero-confidence
 * hold and sets malformed.
 */
Decision decision_from_reply(const std::string& text, bool& malformed);

} // namespace oracle
} // namespace chartagent
