#include "../../include/perception/snapshot_extractor.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>

namespace chartagent::perception {

namespace {

template <size_t N>
bool in_vocabulary(const char* const (&vocab)[N], const std::string& token) {
    return std::any_of(std::begin(vocab), std::end(vocab), [&](const char* w) { return token == w; });
}

// First word of a separator-less text, e.g. "RSI 28.5" -> "rsi"
std::string leading_word(const std::string& text) {
    std::string t = util::trim(text);
    size_t end = t.find_first_of(" \t(");
    return util::to_lower(t.substr(0, end));
}

} // namespace

// =============================================================================
// Vocabulary lookups
// =============================================================================

bool is_indicator_keyword(const std::string& key) { return in_vocabulary(INDICATOR_KEYWORDS, key); }
bool is_price_level_keyword(const std::string& key) { return in_vocabulary(PRICE_LEVEL_KEYWORDS, key); }
bool is_bullish_pattern(const std::string& token) { return in_vocabulary(BULLISH_PATTERNS, token); }
bool is_bearish_pattern(const std::string& token) { return in_vocabulary(BEARISH_PATTERNS, token); }

bool is_known_pattern(const std::string& token) {
    return is_bullish_pattern(token) || is_bearish_pattern(token) || in_vocabulary(NEUTRAL_PATTERNS, token);
}

bool parse_numeric_value(const std::string& text, double& out) {
    std::string value = util::trim(text);
    if (!value.empty() && value.back() == '%') {
        value.pop_back();
        value = util::trim(value);
    }
    if (value.empty()) return false;

    const char* begin = value.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;
    if (!std::isfinite(parsed)) return false;

    out = parsed;
    return true;
}

std::string normalize_key(const std::string& raw_key) {
    std::string key = raw_key;
    size_t paren = key.find('(');
    if (paren != std::string::npos) {
        size_t close = key.find(')', paren);
        key.erase(paren, close == std::string::npos ? std::string::npos : close - paren + 1);
    }
    return util::normalize_token(key);
}

// =============================================================================
// MarketSnapshotExtractor
// =============================================================================

MarketSnapshot MarketSnapshotExtractor::extract(const std::vector<ParsedElement>& elements) const {
    return extract(elements, util::wall_clock_ns());
}

MarketSnapshot MarketSnapshotExtractor::extract(const std::vector<ParsedElement>& elements,
                                                Timestamp observed_at) const {
    MarketSnapshot snapshot;
    snapshot.instrument = instrument_;
    snapshot.observed_at = observed_at;
    snapshot.element_count = elements.size();

    for (const auto& element : elements) {
        if (element.kind == ElementKind::Icon) {
            extract_icon(element, snapshot);
        } else {
            extract_text(element, snapshot);
        }
    }

    CA_LOGF(logger_, Debug, Perception, "Snapshot: %zu elements, %zu indicators, %zu levels, %zu patterns",
            snapshot.element_count, snapshot.indicators.size(), snapshot.price_levels.size(),
            snapshot.patterns.size());
    return snapshot;
}

void MarketSnapshotExtractor::extract_text(const ParsedElement& element, MarketSnapshot& snapshot) const {
    size_t sep = element.text.find(':');

    if (sep == std::string::npos) {
        // "RSI 28.5" looks like data but cannot be split reliably
        std::string word = leading_word(element.text);
        if (is_indicator_keyword(word) || is_price_level_keyword(word)) {
            ++malformed_count_;
            CA_LOGF(logger_, Warn, Perception, "Skipping element without separator: '%s'", element.text.c_str());
        }
        return;
    }

    std::string key = normalize_key(element.text.substr(0, sep));
    bool is_indicator = is_indicator_keyword(key);
    bool is_level = !is_indicator && is_price_level_keyword(key);
    if (!is_indicator && !is_level) return;

    double value = 0;
    if (!parse_numeric_value(element.text.substr(sep + 1), value)) {
        ++malformed_count_;
        CA_LOGF(logger_, Warn, Perception, "Skipping malformed value for '%s': '%s'", key.c_str(),
                element.text.c_str());
        return;
    }

    if (is_indicator) {
        snapshot.indicators[key] = value;
    } else {
        snapshot.price_levels[key] = value;
    }
}

void MarketSnapshotExtractor::extract_icon(const ParsedElement& element, MarketSnapshot& snapshot) const {
    std::string token = util::normalize_token(element.text);
    if (is_known_pattern(token)) {
        snapshot.patterns.insert(token);
    }
}

// =============================================================================
// Spatial summary
// =============================================================================

SpatialSummary summarize_spatial(const std::vector<ParsedElement>& elements) {
    SpatialSummary summary;

    double height = 1.0;
    for (const auto& element : elements) {
        if (element.bounding_box) {
            height = std::max(height, element.bounding_box->y2);
        }
    }

    for (const auto& element : elements) {
        if (!element.bounding_box) {
            ++summary.unplaced;
            continue;
        }
        double y = element.bounding_box->center_y() / height;
        if (y < 1.0 / 3.0) {
            ++summary.top;
        } else if (y < 2.0 / 3.0) {
            ++summary.middle;
        } else {
            ++summary.bottom;
        }
    }
    return summary;
}

} // namespace chartagent::perception
