#pragma once

#include <cstdint>
#include <string>

namespace chartagent {

/**
 * ErrorCategory - how the controller reacts to a failed external call
 *
 * Transient and Timeout count toward the circuit breaker threshold.
 * The three fatal categories halt the agent on first occurrence.
 */
enum class ErrorCategory : uint8_t {
    None = 0,
    Transient,           // Network blip, HTTP 5xx, unexpected body
    Timeout,             // Call exceeded its deadline
    CredentialInvalid,   // Fatal: API key rejected
    BalanceInsufficient, // Fatal: account cannot fund orders
    ConnectivityLost     // Fatal: broker link gone
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Transient: return "transient";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::CredentialInvalid: return "credential_invalid";
        case ErrorCategory::BalanceInsufficient: return "balance_insufficient";
        case ErrorCategory::ConnectivityLost: return "connectivity_lost";
        default: return "unknown";
    }
}

inline bool is_fatal(ErrorCategory category) {
    return category == ErrorCategory::CredentialInvalid ||
           category == ErrorCategory::BalanceInsufficient ||
           category == ErrorCategory::ConnectivityLost;
}

struct ServiceError {
    ErrorCategory category = ErrorCategory::None;
    std::string message;

    bool is_fatal() const { return chartagent::is_fatal(category); }

    static ServiceError transient(std::string msg) { return ServiceError{ErrorCategory::Transient, std::move(msg)}; }
    static ServiceError timeout(std::string msg) { return ServiceError{ErrorCategory::Timeout, std::move(msg)}; }
};

} // namespace chartagent
