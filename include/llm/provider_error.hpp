#pragma once

#include <string>
#include <stdexcept>

namespace nugget {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorCategory {
    Structural,         // Response shape violates the contract; integration bug
    AuthConfig,         // Bad credentials or invalid request parameters
    RateLimit,          // Provider throttling
    Transient,          // Connectivity problem or timeout
    ServerError,        // Upstream 5xx
    ModelUnavailable,   // Model or endpoint missing on this provider
    Cancelled,          // Caller cancelled or the deadline passed
    Unknown             // Nothing matched
};

std::string error_category_to_string(ErrorCategory category);

/**
 * @brief Failure raised by an LLM provider call
 *
 * Carries the classification alongside the raw message so callers can pick
 * a retry policy and a user-facing message without re-parsing text.
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(ErrorCategory category,
                  const std::string& message,
                  int status_code = 0,
                  const std::string& provider_id = "")
        : std::runtime_error(message),
          category_(category),
          status_code_(status_code),
          provider_id_(provider_id) {}

    ErrorCategory category() const { return category_; }
    int status_code() const { return status_code_; }                ///< HTTP status, 0 if none
    const std::string& provider_id() const { return provider_id_; }

private:
    ErrorCategory category_;
    int status_code_;
    std::string provider_id_;
};

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief Map an HTTP status code to a category
 *
 * 400/401/403 and other client errors -> AuthConfig, 404 -> ModelUnavailable,
 * 408 -> Transient, 429 -> RateLimit, 5xx -> ServerError. Anything else,
 * including 0, is Unknown.
 */
ErrorCategory classify_status(int status_code);

/**
 * @brief Classify a failure, preferring the status code
 *
 * When the status code is absent or unmapped, falls back to substring
 * matching on the lower-cased message. Provider messages are not a stable
 * contract, so the keyword table is a heuristic and should be revisited per
 * provider.
 */
ErrorCategory classify_error(int status_code, const std::string& message);

/**
 * @brief Whether the same provider may be called again after a backoff
 */
bool is_retryable(ErrorCategory category);

/**
 * @brief Whether switching to another provider is worth trying at once
 */
bool is_fallback_eligible(ErrorCategory category);

/**
 * @brief Message suitable for showing to an end user
 */
std::string user_facing_message(ErrorCategory category,
                                const std::string& provider_id,
                                const std::string& message);

inline std::string user_facing_message(const ProviderError& error) {
    return user_facing_message(error.category(), error.provider_id(), error.what());
}

} // namespace nugget
