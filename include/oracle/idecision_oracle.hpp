#pragma once

#include "../core/service_error.hpp"
#include "../types.hpp"

#include <string_view>
#include <vector>

namespace chartagent {
namespace oracle {

struct OracleRequest {
    MarketSnapshot snapshot;
    std::vector<StrategySignal> signals;
    Consensus consensus;
    std::vector<TradeRecord> recent_trades; // Oldest first, at most 5
    PerformanceSnapshot performance;
};

struct OracleResponse {
    bool success = false;
    Decision decision;
    bool malformed = false; // Reply arrived but was unusable; decision is a safe hold
    std::string raw_response;
    ServiceError error;
};

/**
 * IDecisionOracle - recommends one action for the current cycle
 *
 * Transport and credential problems come back as success=false with a
 * ServiceError. An unusable reply is not an error: the oracle answers
 * with a zero-confidence hold and sets malformed.
 */
class IDecisionOracle {
public:
    virtual ~IDecisionOracle() = default;

    virtual OracleResponse decide(const OracleRequest& request) = 0;

    virtual std::string_view name() const = 0;
};

} // namespace oracle
} // namespace chartagent
