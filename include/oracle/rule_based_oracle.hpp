#pragma once

#include "../logging/async_logger.hpp"
#include "idecision_oracle.hpp"

#include <sstream>

namespace chartagent {
namespace oracle {

/**
 * RuleBasedOracle - deterministic oracle over the strategy consensus
 *
 * Opens in the consensus direction with the consensus strength as
 * confidence; holds on no signal or a tie. Never fails, so it doubles as
 * the offline mode when no LLM credentials are configured.
 */
class RuleBasedOracle : public IDecisionOracle {
public:
    explicit RuleBasedOracle(double min_confidence = 0.0, logging::AsyncLogger* logger = nullptr)
        : min_confidence_(min_confidence), logger_(logger) {}

    OracleResponse decide(const OracleRequest& request) override {
        OracleResponse response;
        response.success = true;

        const auto& c = request.consensus;
        if (c.direction == Direction::None) {
            response.decision = Decision::hold(c.is_tie() ? "Strategies split evenly" : "No strategy signal");
            return response;
        }

        if (c.strength < min_confidence_) {
            response.decision = Decision::hold("Consensus too weak", c.strength);
            return response;
        }

        std::ostringstream reason;
        reason << "Consensus " << direction_to_string(c.direction) << " " << c.buy_votes << "/" << c.sell_votes
               << " from";
        for (const auto& name : c.triggered) {
            reason << " " << name;
        }

        response.decision = Decision::open(c.direction, c.strength, {reason.str()});
        CA_LOGF(logger_, Debug, Oracle, "%s", reason.str().c_str());
        return response;
    }

    std::string_view name() const override { return "rules"; }

private:
    double min_confidence_;
    logging::AsyncLogger* logger_;
};

} // namespace oracle
} // namespace chartagent
