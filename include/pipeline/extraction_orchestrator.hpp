#pragma once

#include "nugget/nugget.hpp"
#include "llm/llm_provider.hpp"
#include "llm/provider_error.hpp"
#include "llm/cancellation_token.hpp"
#include "llm/response_cache.hpp"
#include "validation/content_validator.hpp"
#include "anchor/boundary_resolver.hpp"
#include "pipeline/consensus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <stdexcept>

namespace nugget {

// ============================================================================
// Orchestrator Configuration
// ============================================================================

/**
 * @brief A provider to switch to when the current one keeps failing
 */
struct FallbackProvider {
    std::string provider;                   ///< "openai" or "gemini"
    std::string api_key;                    ///< API key
    std::string model;                      ///< Model name, provider default when empty
};

/**
 * @brief Configuration for the extraction orchestrator
 */
struct OrchestratorConfig {
    // LLM Configuration
    std::string llm_provider = "gemini";    ///< "openai" or "gemini"
    std::string llm_api_key;                ///< API key
    std::string llm_model;                  ///< Model name, provider default when empty
    double llm_temperature = 0.7;           ///< Default sampling temperature
    int llm_max_tokens = 8192;              ///< Max completion tokens
    int llm_timeout_seconds = 60;           ///< Request timeout
    std::vector<FallbackProvider> fallback_providers;  ///< Tried in order after the primary

    // Retry Configuration
    int max_attempts = 3;                   ///< Provider calls per extraction, across providers
    double base_delay_ms = 1000.0;          ///< First backoff delay
    double rate_limit_multiplier = 2.0;     ///< Scales base and cap for rate limits
    double jitter_fraction = 0.1;           ///< Jitter as a fraction of the delay
    double max_delay_ms = 30000.0;          ///< Backoff cap
    int fallback_after_failures = 2;        ///< Consecutive failures before switching provider

    // Content Configuration
    size_t max_content_length = 30000;      ///< Longer content is truncated before the call

    // Cache Configuration
    bool enable_cache = true;               ///< Reuse responses for repeated content
    size_t cache_capacity = 10;             ///< Entries kept
    int cache_ttl_seconds = 300;            ///< Entry lifetime

    // Validation Configuration
    ValidationOptions validation;           ///< Content validator settings
    BoundaryMatchOptions boundary;          ///< Anchor settings

    bool verbose = false;                   ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     *
     * Accepts both the full key names (llm_provider, llm_api_key, ...) and
     * the short provider file format (provider, api_key, model).
     */
    static OrchestratorConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API keys redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     *
     * NUGGET_LLM_PROVIDER, NUGGET_<PROVIDER>_API_KEY or <PROVIDER>_API_KEY,
     * NUGGET_LLM_MODEL, and NUGGET_FALLBACK_PROVIDER as a comma separated
     * list ordered by fallback priority.
     */
    static OrchestratorConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Extraction Request and Result
// ============================================================================

/**
 * @brief Per-call overrides
 */
struct ExtractionOptions {
    std::optional<double> temperature;          ///< Provider default when absent
    std::vector<NuggetType> selected_types;     ///< Empty selects all types
    std::optional<double> validation_threshold; ///< Overrides min_confidence_threshold
    int timeout_ms = 0;                         ///< Overall deadline, 0 for none
};

/**
 * @brief Resolved nuggets plus aggregate metadata for one extraction
 */
struct ExtractionReport {
    std::vector<ResolvedNugget> nuggets;
    int total_count = 0;
    int validated_count = 0;
    double average_validation_score = 0.0;  ///< Mean over all nuggets, 0 when none
    double elapsed_ms = 0.0;
    std::string provider_id;                ///< Provider that answered
    int attempts = 0;                       ///< Provider calls made, 0 on a cache hit
    bool from_cache = false;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Settings for ensemble extraction
 */
struct EnsembleOptions {
    int runs = 3;                           ///< Independent extractions to combine
    double similarity_threshold = 0.8;      ///< Cosine similarity needed to merge candidates
    int min_supporting_runs = 1;            ///< Drop groups seen in fewer runs
    double default_temperature = 0.7;       ///< Used when ExtractionOptions has none
};

/**
 * @brief Resolved nugget with the runs that agreed on it
 */
struct ConsensusNugget {
    ResolvedNugget nugget;                  ///< confidence holds the agreement ratio
    int supporting_runs = 0;
    int group_size = 0;
    double cohesion = 1.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Result of combining several extraction runs
 */
struct EnsembleReport {
    std::vector<ConsensusNugget> nuggets;
    int total_runs = 0;
    int successful_runs = 0;
    int candidate_count = 0;                ///< Candidates across all successful runs
    int duplicates_removed = 0;             ///< Candidates merged into a kept nugget
    int validated_count = 0;
    double average_validation_score = 0.0;  ///< Mean over all nuggets, 0 when none
    double elapsed_ms = 0.0;
    int attempts = 0;                       ///< Provider calls across all runs

    void print_summary() const;
    nlohmann::json to_json() const;
};

/**
 * @brief Bookkeeping for one extraction call
 */
struct RetryState {
    int attempt = 0;                        ///< Provider calls made so far
    size_t provider_index = 0;              ///< Current provider
    std::string provider_id;
    int consecutive_failures = 0;           ///< Failures on the current provider
    std::optional<ProviderError> last_error;
};

/**
 * @brief Final failure of an extraction after the retry policy gave up
 *
 * Carries the classification of the last provider error, not the first.
 */
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(ErrorCategory category,
                    const std::string& message,
                    const std::string& user_message,
                    const std::string& provider_id,
                    int status_code,
                    int attempts)
        : std::runtime_error(message),
          category_(category),
          user_message_(user_message),
          provider_id_(provider_id),
          status_code_(status_code),
          attempts_(attempts) {}

    ErrorCategory category() const { return category_; }
    const std::string& user_message() const { return user_message_; }
    const std::string& provider_id() const { return provider_id_; }
    int status_code() const { return status_code_; }
    int attempts() const { return attempts_; }

private:
    ErrorCategory category_;
    std::string user_message_;
    std::string provider_id_;
    int status_code_;
    int attempts_;
};

// ============================================================================
// Retry Callbacks
// ============================================================================

/**
 * @brief Called after each failed attempt that will be followed by another
 *
 * delay_ms is 0 when switching provider; next_provider_id equals
 * provider_id when retrying in place.
 */
using RetryCallback = std::function<void(
    const std::string& provider_id,
    int attempt,
    ErrorCategory category,
    double delay_ms,
    const std::string& next_provider_id
)>;

// ============================================================================
// Extraction Orchestrator
// ============================================================================

/**
 * @brief Drives providers and resolves their candidates against the source
 *
 * One call runs a bounded loop: call the current provider, and on failure
 * classify the error, then either retry after a backoff, switch to the next
 * provider, or give up. Successful candidates are validated and anchored
 * against the full, untruncated content.
 */
class ExtractionOrchestrator {
public:
    /**
     * @brief Constructor with ready-made providers
     *
     * @param providers Primary first, fallbacks in order; at least one
     * @throws std::invalid_argument when providers is empty
     */
    ExtractionOrchestrator(std::vector<std::unique_ptr<LLMProvider>> providers,
                           const OrchestratorConfig& config = OrchestratorConfig());

    /**
     * @brief Constructor building providers through the factory
     *
     * @throws std::invalid_argument when the configuration is invalid
     */
    explicit ExtractionOrchestrator(const OrchestratorConfig& config);

    /**
     * @brief Extract, validate and anchor golden nuggets
     *
     * @param content Source text
     * @param prompt Extraction instructions; default prompt when empty
     * @param options Per-call overrides
     * @param cancel Optional token; cancels backoff waits and in-flight calls
     * @throws ExtractionError when the retry policy gives up
     */
    ExtractionReport extract_validated(
        const std::string& content,
        const std::string& prompt = "",
        const ExtractionOptions& options = ExtractionOptions(),
        const CancellationToken* cancel = nullptr
    );

    /**
     * @brief Run several extractions and keep what they agree on
     *
     * Each run goes through the full retry and fallback loop; the cache is
     * bypassed so runs stay independent. A failed run is skipped unless it
     * was cancelled. Candidates of the successful runs are merged with
     * build_consensus and the representatives anchored against the content.
     * options.timeout_ms bounds the whole ensemble.
     *
     * @throws ExtractionError when cancelled or when every run failed
     * @throws std::invalid_argument for out-of-range options
     */
    EnsembleReport extract_ensemble(
        const std::string& content,
        const std::string& prompt = "",
        const ExtractionOptions& options = ExtractionOptions(),
        const EnsembleOptions& ensemble = EnsembleOptions(),
        const CancellationToken* cancel = nullptr
    );

    /**
     * @brief Backoff before the next attempt on the same provider
     *
     * min(base * 2^(attempt-1), cap) plus jitter_unit * jitter_fraction of
     * that delay. Rate limits scale both base and cap.
     *
     * @param jitter_unit Random draw in [0, 1)
     */
    static double compute_backoff_delay_ms(ErrorCategory category,
                                           int attempt,
                                           const OrchestratorConfig& config,
                                           double jitter_unit);

    /**
     * @brief Set retry callback
     */
    void set_retry_callback(RetryCallback callback);

    /**
     * @brief Replace the response cache (nullptr disables caching)
     */
    void set_cache(std::shared_ptr<ResponseCache> cache);
    std::shared_ptr<ResponseCache> get_cache() const { return cache_; }

    std::vector<std::string> provider_ids() const;
    const OrchestratorConfig& get_config() const { return config_; }

private:
    OrchestratorConfig config_;
    std::vector<std::unique_ptr<LLMProvider>> providers_;
    std::shared_ptr<ResponseCache> cache_;
    RetryCallback retry_callback_;

    /**
     * @brief Run the retry/fallback loop until a provider answers
     */
    std::vector<RawCandidate> call_providers(
        const std::string& content,
        const std::string& prompt,
        const ExtractionOptions& options,
        const CancellationToken* cancel,
        RetryState& state
    );

    /**
     * @brief Keep the last provider error, or a timeout when there is none
     */
    void record_deadline(RetryState& state, int timeout_ms) const;

    /**
     * @brief Sleep for the backoff, returning false when cancelled
     */
    bool wait_backoff(double delay_ms, const CancellationToken* cancel) const;

    void check_options(const ExtractionOptions& options) const;

    std::string prepare_payload(const std::string& content) const;

    ExtractionReport build_report(const std::vector<RawCandidate>& candidates,
                                  const std::string& content,
                                  const ExtractionOptions& options) const;

    /**
     * @brief Error surfacing the last provider failure
     */
    ExtractionError make_error(const RetryState& state) const;
    ExtractionError make_cancelled_error(const RetryState& state, const std::string& reason) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Create default orchestrator configuration
 */
OrchestratorConfig create_default_config();

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries config_path, then .nugget_config.json in the current directory and
 * one and two levels up; the first file with an API key wins.
 */
OrchestratorConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace nugget
