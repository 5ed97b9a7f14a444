#pragma once

/**
 * CircuitBreaker - stops the agent after repeated or fatal cycle failures
 *
 * Every cycle reports exactly one outcome:
 *   on_success()          -> counter back to 0
 *   on_failure(err)       -> counter + 1, Halt at the threshold
 *
 * Fatal categories (credential, balance, connectivity) halt on the first
 * occurrence regardless of the counter. A success after a halt clears it;
 * the verdict only ever depends on the counter and the error category.
 */

#include "../config/defaults.hpp"
#include "../core/service_error.hpp"
#include "../util/string_utils.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace chartagent {
namespace safety {

enum class BreakerVerdict : uint8_t { Continue = 0, Halt };

inline const char* breaker_verdict_to_string(BreakerVerdict verdict) {
    switch (verdict) {
        case BreakerVerdict::Continue: return "continue";
        case BreakerVerdict::Halt: return "halt";
        default: return "unknown";
    }
}

/**
 * True if `code` appears as a status code: right after "http ", "status "
 * or "code " and not followed by another digit. Prices, ids and timestamps
 * that merely contain the digits do not match.
 */
inline bool mentions_status_code(const std::string& lowered, const std::string& code) {
    static const char* const prefixes[] = {"http ", "http/1.1 ", "status ", "status: ", "status=", "code ", "code: "};
    for (const char* prefix : prefixes) {
        std::string needle = std::string(prefix) + code;
        size_t pos = lowered.find(needle);
        while (pos != std::string::npos) {
            size_t end = pos + needle.size();
            bool token_start = pos == 0 || !std::isalnum(static_cast<unsigned char>(lowered[pos - 1]));
            bool token_end = end >= lowered.size() || !std::isdigit(static_cast<unsigned char>(lowered[end]));
            if (token_start && token_end) return true;
            pos = lowered.find(needle, pos + 1);
        }
    }
    return false;
}

/**
 * Map free-form service error text to a category.
 *
 * Matching is case-insensitive substring search, fatal phrases first.
 * Anything unrecognised is Transient.
 */
inline ErrorCategory classify_error_message(const std::string& text) {
    std::string t = util::to_lower(text);

    if (util::contains(t, "api key invalid") || util::contains(t, "invalid api key") ||
        util::contains(t, "unauthorized") || mentions_status_code(t, "401")) {
        return ErrorCategory::CredentialInvalid;
    }
    if (util::contains(t, "balance too low") || util::contains(t, "insufficient")) {
        return ErrorCategory::BalanceInsufficient;
    }
    if (util::contains(t, "connection to broker lost")) {
        return ErrorCategory::ConnectivityLost;
    }
    if (util::contains(t, "timed out") || util::contains(t, "timeout")) {
        return ErrorCategory::Timeout;
    }
    return ErrorCategory::Transient;
}

class CircuitBreaker {
public:
    explicit CircuitBreaker(int32_t threshold = config::breaker::FAILURE_THRESHOLD)
        : threshold_(threshold > 0 ? threshold : 1) {}

    void on_success() {
        consecutive_errors_ = 0;
        halted_ = false;
        halt_reason_.reset();
    }

    BreakerVerdict on_failure(const ServiceError& error) {
        ++consecutive_errors_;
        ++total_errors_;

        if (error.is_fatal() || consecutive_errors_ >= threshold_) {
            halted_ = true;
            halt_reason_ = error;
            return BreakerVerdict::Halt;
        }
        return BreakerVerdict::Continue;
    }

    // Manual restart after a halt (operator start)
    void reset() {
        consecutive_errors_ = 0;
        halted_ = false;
        halt_reason_.reset();
    }

    // Restore the counter from persisted state without replaying errors
    void restore(int32_t consecutive_errors) {
        consecutive_errors_ = consecutive_errors < 0 ? 0 : consecutive_errors;
    }

    int32_t consecutive_errors() const { return consecutive_errors_; }
    uint64_t total_errors() const { return total_errors_; }
    int32_t threshold() const { return threshold_; }
    bool is_halted() const { return halted_; }
    const std::optional<ServiceError>& halt_reason() const { return halt_reason_; }

private:
    int32_t threshold_;
    int32_t consecutive_errors_ = 0;
    uint64_t total_errors_ = 0;
    bool halted_ = false;
    std::optional<ServiceError> halt_reason_;
};

} // namespace safety
} // namespace chartagent
