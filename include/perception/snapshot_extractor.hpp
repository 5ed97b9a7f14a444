#pragma once

#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <string>
#include <vector>

namespace chartagent {
namespace perception {

// =============================================================================
// Vocabularies
// =============================================================================

// Text keys routed to MarketSnapshot::indicators
inline constexpr const char* INDICATOR_KEYWORDS[] = {
    "rsi", "macd", "adx", "atr", "volatility", "stochastic", "cci", "momentum", "ema", "sma",
};

// Text keys routed to MarketSnapshot::price_levels
inline constexpr const char* PRICE_LEVEL_KEYWORDS[] = {
    "price", "bid", "ask", "open", "high", "low", "close", "support", "resistance",
};

inline constexpr const char* BULLISH_PATTERNS[] = {
    "bullish_engulfing", "hammer", "morning_star", "piercing_line",
    "three_white_soldiers", "bullish_harami", "inverted_hammer",
};

inline constexpr const char* BEARISH_PATTERNS[] = {
    "bearish_engulfing", "shooting_star", "evening_star", "dark_cloud_cover",
    "three_black_crows", "bearish_harami", "hanging_man",
};

inline constexpr const char* NEUTRAL_PATTERNS[] = {"doji"};

bool is_indicator_keyword(const std::string& key);
bool is_price_level_keyword(const std::string& key);
bool is_bullish_pattern(const std::string& token);
bool is_bearish_pattern(const std::string& token);
bool is_known_pattern(const std::string& token);

/**
 * Parse the value half of "key: value".
 *
 * Accepts a plain decimal with an optional single trailing '%'.
 * Returns false for anything else (units, words, empty, non-finite).
 */
bool parse_numeric_value(const std::string& text, double& out);

/**
 * Key half of "key: value" with any parenthesised period removed,
 * normalized. "RSI(14)" -> "rsi", "Stop Loss" -> "stop_loss".
 */
std::string normalize_key(const std::string& raw_key);

// =============================================================================
// MarketSnapshotExtractor
// =============================================================================

/**
 * MarketSnapshotExtractor - parsed chart elements -> typed MarketSnapshot
 *
 * Never fails: malformed entries are logged and skipped, unmatched entries
 * are ignored. Every input element counts toward element_count. When a key
 * appears twice the later element wins.
 */
class MarketSnapshotExtractor {
public:
    explicit MarketSnapshotExtractor(std::string instrument, logging::AsyncLogger* logger = nullptr)
        : instrument_(std::move(instrument)), logger_(logger) {}

    MarketSnapshot extract(const std::vector<ParsedElement>& elements) const;
    MarketSnapshot extract(const std::vector<ParsedElement>& elements, Timestamp observed_at) const;

    // Malformed entries seen across all extract() calls
    size_t malformed_count() const { return malformed_count_; }

    const std::string& instrument() const { return instrument_; }
    void set_instrument(std::string instrument) { instrument_ = std::move(instrument); }

private:
    std::string instrument_;
    logging::AsyncLogger* logger_;
    mutable size_t malformed_count_ = 0;

    void extract_text(const ParsedElement& element, MarketSnapshot& snapshot) const;
    void extract_icon(const ParsedElement& element, MarketSnapshot& snapshot) const;
};

/**
 * Count elements whose bounding-box centre lies in the upper, middle or
 * lower third of the image. Coordinates above 1 are treated as pixels and
 * scaled by the largest y2 seen.
 */
SpatialSummary summarize_spatial(const std::vector<ParsedElement>& elements);

} // namespace perception
} // namespace chartagent
