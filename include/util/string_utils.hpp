#pragma once

/**
 * String utilities for the chart agent
 *
 * Token normalization used when matching parsed chart text against
 * indicator and pattern vocabularies.
 */

#include <algorithm>
#include <cctype>
#include <string>

namespace chartagent {
namespace util {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/**
 * Lowercase, trim, and map spaces/hyphens to underscores.
 *
 * Example: normalize_token(" Bullish Engulfing ") -> "bullish_engulfing"
 */
inline std::string normalize_token(const std::string& s) {
    std::string out = to_lower(trim(s));
    for (auto& c : out) {
        if (c == ' ' || c == '-') c = '_';
    }
    return out;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace util
}  // namespace chartagent
