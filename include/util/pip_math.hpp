#pragma once

/**
 * Forex pip arithmetic
 *
 * Pip size follows the quote currency (JPY pairs quote to 2 decimals).
 * Pip values are USD per pip for one standard lot.
 */

#include "../config/defaults.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace chartagent {
namespace util {

inline std::string normalize_pair(const std::string& pair) {
    std::string out;
    for (char c : pair) {
        if (c != '/' && c != '_' && c != '-' && c != ' ')
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool is_jpy_pair(const std::string& pair) {
    std::string p = normalize_pair(pair);
    return p.size() >= 6 && p.compare(3, 3, "JPY") == 0;
}

inline double pip_size(const std::string& pair) { return is_jpy_pair(pair) ? 0.01 : 0.0001; }

inline double pips_to_price(double pips, const std::string& pair) { return pips * pip_size(pair); }

inline double price_to_pips(double distance, const std::string& pair) { return distance / pip_size(pair); }

/**
 * USD value of one pip for one standard lot.
 * Unknown pairs fall back to 10.
 */
inline double pip_value_per_lot(const std::string& pair) {
    struct Entry {
        const char* pair;
        double value;
    };
    static constexpr Entry TABLE[] = {
        {"EURUSD", 10.0}, {"GBPUSD", 10.0}, {"USDJPY", 9.40}, {"AUDUSD", 10.0},
        {"USDCHF", 10.60}, {"USDCAD", 7.60}, {"NZDUSD", 10.0},
    };
    std::string p = normalize_pair(pair);
    for (const auto& e : TABLE) {
        if (p == e.pair) return e.value;
    }
    return 10.0;
}

inline double pip_value(const std::string& pair, double lots) { return pip_value_per_lot(pair) * lots; }

/**
 * Lots to trade so that hitting the stop loses risk_pct of balance.
 * Rounded to 2 decimals (micro lots); 0 when the stop carries no risk.
 *
 * @param balance Account balance in USD
 * @param risk_pct Risk per trade in percent (1.0 = 1%)
 * @param stop_pips Stop-loss distance in pips
 */
inline double position_size(double balance, double risk_pct, double stop_pips, const std::string& pair) {
    double risk_amount = balance * (risk_pct / 100.0);
    double denominator = stop_pips * pip_value_per_lot(pair);
    if (denominator <= 0) return 0.0;
    return std::round(risk_amount / denominator * 100.0) / 100.0;
}

/**
 * Realized P/L in USD for a position closed at exit.
 */
inline double profit_loss(bool is_buy, double entry, double exit, double lots, const std::string& pair) {
    double move = is_buy ? exit - entry : entry - exit;
    return price_to_pips(move, pair) * pip_value(pair, lots);
}

}  // namespace util
}  // namespace chartagent
