#include "llm/provider_error.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace nugget {

namespace {

std::string lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

// Keyword tables, checked in this order
const std::vector<std::string> kStructuralKeywords = {
    "malformed",
    "invalid response format",
    "missing required field",
    "unexpected response shape",
};

const std::vector<std::string> kAuthConfigKeywords = {
    "invalid api key",
    "api key not found",
    "api key",
    "unauthorized",
    "authentication",
    "authorization",
    "forbidden",
    "invalid request",
    "bad request",
    "401",
    "403",
};

const std::vector<std::string> kRateLimitKeywords = {
    "rate limit",
    "rate_limit_exceeded",
    "too many requests",
    "quota exceeded",
    "requests per minute",
    "daily quota",
    "429",
};

const std::vector<std::string> kModelUnavailableKeywords = {
    "model not found",
    "model_not_found",
    "model not available",
    "model does not exist",
    "provider not available",
    "no allowed providers",
    "not found",
    "404",
};

const std::vector<std::string> kServerErrorKeywords = {
    "internal server error",
    "server error",
    "500",
    "502",
};

const std::vector<std::string> kTransientKeywords = {
    "network error",
    "network request failed",
    "fetch failed",
    "connection failed",
    "timeout",
    "timed out",
    "service unavailable",
    "temporarily unavailable",
    "503",
    "504",
};

std::string provider_label(const std::string& provider_id) {
    return provider_id.empty() ? "the provider" : provider_id;
}

} // anonymous namespace

std::string error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Structural: return "structural";
        case ErrorCategory::AuthConfig: return "auth_config";
        case ErrorCategory::RateLimit: return "rate_limit";
        case ErrorCategory::Transient: return "transient";
        case ErrorCategory::ServerError: return "server_error";
        case ErrorCategory::ModelUnavailable: return "model_unavailable";
        case ErrorCategory::Cancelled: return "cancelled";
        case ErrorCategory::Unknown: return "unknown";
        default: return "unknown";
    }
}

ErrorCategory classify_status(int status_code) {
    if (status_code == 429) return ErrorCategory::RateLimit;
    if (status_code == 408) return ErrorCategory::Transient;
    if (status_code == 404) return ErrorCategory::ModelUnavailable;
    if (status_code >= 500 && status_code < 600) return ErrorCategory::ServerError;
    if (status_code >= 400 && status_code < 500) return ErrorCategory::AuthConfig;
    return ErrorCategory::Unknown;
}

ErrorCategory classify_error(int status_code, const std::string& message) {
    ErrorCategory from_status = classify_status(status_code);
    if (from_status != ErrorCategory::Unknown) {
        return from_status;
    }

    std::string text = lower(message);

    if (contains_any(text, kStructuralKeywords)) return ErrorCategory::Structural;
    if (contains_any(text, kRateLimitKeywords)) return ErrorCategory::RateLimit;
    if (contains_any(text, kAuthConfigKeywords)) return ErrorCategory::AuthConfig;
    if (contains_any(text, kModelUnavailableKeywords)) return ErrorCategory::ModelUnavailable;
    if (contains_any(text, kTransientKeywords)) return ErrorCategory::Transient;
    if (contains_any(text, kServerErrorKeywords)) return ErrorCategory::ServerError;

    return ErrorCategory::Unknown;
}

bool is_retryable(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::RateLimit:
        case ErrorCategory::Transient:
        case ErrorCategory::ServerError:
        case ErrorCategory::Unknown:
            return true;
        default:
            return false;
    }
}

bool is_fallback_eligible(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ServerError:
        case ErrorCategory::ModelUnavailable:
        case ErrorCategory::Unknown:
            return true;
        default:
            return false;
    }
}

std::string user_facing_message(ErrorCategory category,
                                const std::string& provider_id,
                                const std::string& message) {
    const std::string who = provider_label(provider_id);
    const std::string text = lower(message);

    switch (category) {
        case ErrorCategory::Structural:
            return "Unexpected response from " + who + ": " + message +
                   ". The provider returned data in an unsupported shape.";

        case ErrorCategory::AuthConfig:
            if (text.find("bad request") != std::string::npos ||
                text.find("invalid request") != std::string::npos) {
                return "Invalid request to " + who + ": " + message +
                       ". The content might be too large or contain unsupported characters.";
            }
            return "Invalid API key or configuration for " + who + ": " + message +
                   ". Please check your " + who + " API key in settings.";

        case ErrorCategory::RateLimit:
            if (text.find("quota") != std::string::npos) {
                return "API quota exceeded for " + who + ": " + message +
                       ". Please check your usage limits.";
            }
            return "Rate limit reached for " + who + ". Please wait before trying again.";

        case ErrorCategory::Transient:
            if (text.find("timeout") != std::string::npos ||
                text.find("timed out") != std::string::npos) {
                return "Request to " + who + " timed out: " + message + ". Please try again.";
            }
            return "Network error contacting " + who + ": " + message +
                   ". Please check your internet connection.";

        case ErrorCategory::ServerError:
            return who + " server error: " + message + ". Please try again later.";

        case ErrorCategory::ModelUnavailable:
            return "Model or endpoint not available on " + who + ": " + message +
                   ". Please check the configured model name.";

        case ErrorCategory::Cancelled:
            return "Extraction was cancelled.";

        case ErrorCategory::Unknown:
        default:
            return who + " API error: " + message;
    }
}

} // namespace nugget
