#pragma once

#include "../types.hpp"

#include <string_view>

namespace chartagent {
namespace strategy {

// =============================================================================
// Strategy Interface
// =============================================================================

class IStrategy {
public:
    virtual ~IStrategy() = default;

    /**
     * Evaluate one snapshot.
     *
     * Must be pure: same snapshot, same signal. A strategy that lacks the
     * inputs it needs returns StrategySignal::none(name()).
     *
     * @param snapshot Current market snapshot
     * @return Signal with direction and strength in [0, 1]
     */
    virtual StrategySignal evaluate(const MarketSnapshot& snapshot) const = 0;

    /// Strategy name for logging and trade attribution
    virtual std::string_view name() const = 0;
};

// =============================================================================
// Helpers
// =============================================================================

inline double clamp_strength(double strength) {
    if (strength < 0) return 0;
    if (strength > 1) return 1;
    return strength;
}

inline StrategySignal make_signal(std::string_view name, Direction direction, double strength) {
    return StrategySignal{std::string(name), direction, clamp_strength(strength)};
}

} // namespace strategy
} // namespace chartagent
