#pragma once

#include "nugget/nugget.hpp"
#include "llm/cancellation_token.hpp"
#include "llm/provider_error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace nugget {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for LLM provider
 */
struct LLMConfig {
    std::string api_key;                    ///< API key for authentication
    std::string model;                      ///< Model name/ID
    std::string api_base_url;               ///< Base URL for API (optional)
    double temperature = 0.7;               ///< Default sampling temperature
    int max_tokens = 8192;                  ///< Maximum tokens in response
    int timeout_seconds = 60;               ///< Request timeout
    bool verbose = false;                   ///< Enable verbose logging
};

/**
 * @brief Message in a conversation
 */
struct Message {
    enum class Role {
        System,
        User,
        Assistant
    };

    Role role;
    std::string content;

    Message(Role r, const std::string& c) : role(r), content(c) {}

    std::string role_string() const {
        switch (role) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            default: return "user";
        }
    }
};

/**
 * @brief Raw completion returned by a provider API
 */
struct LLMResponse {
    std::string content;                    ///< Generated text
    std::string model;                      ///< Model that generated response
    int prompt_tokens = 0;                  ///< Tokens in prompt
    int completion_tokens = 0;              ///< Tokens in completion
    int total_tokens = 0;                   ///< Total tokens used
    double latency_ms = 0.0;                ///< Response latency
};

// ============================================================================
// LLM Provider Interface
// ============================================================================

/**
 * @brief Abstract base class for LLM providers
 *
 * One call is one attempt: implementations never retry on their own.
 * Retries, backoff and provider fallback belong to the orchestrator, which
 * relies on every failure arriving as a classified ProviderError.
 */
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    /**
     * @brief Ask the model for golden nuggets in the content
     *
     * @param content Source text (possibly truncated by the caller)
     * @param prompt Instructions describing what to extract
     * @param temperature Sampling temperature; config default when absent
     * @param types Nugget types to request; empty requests all
     * @param cancel Optional token that aborts the in-flight request
     * @return Candidates in the order the model returned them
     * @throws ProviderError on any failure
     */
    virtual std::vector<RawCandidate> extract(
        const std::string& content,
        const std::string& prompt,
        std::optional<double> temperature = std::nullopt,
        const std::vector<NuggetType>& types = {},
        const CancellationToken* cancel = nullptr
    ) = 0;

    /**
     * @brief Stable provider identifier ("openai", "gemini")
     */
    virtual std::string provider_id() const = 0;

    /**
     * @brief Get current model
     */
    virtual std::string get_model() const = 0;

    /**
     * @brief Check if provider is configured correctly
     */
    virtual bool is_configured() const = 0;

    /**
     * @brief Set configuration
     */
    virtual void set_config(const LLMConfig& config) = 0;

    /**
     * @brief Get current configuration
     */
    virtual LLMConfig get_config() const = 0;

protected:
    LLMConfig config_;

    /**
     * @brief Fail with AuthConfig before any network traffic when no key is set
     */
    void require_configured() const;
};

// ============================================================================
// OpenAI Provider
// ============================================================================

/**
 * @brief OpenAI chat completions provider (JSON response mode)
 */
class OpenAIProvider : public LLMProvider {
public:
    /**
     * @brief Constructor
     *
     * @param api_key OpenAI API key
     * @param model Model name (default: gpt-4o-mini)
     */
    explicit OpenAIProvider(
        const std::string& api_key,
        const std::string& model = "gpt-4o-mini"
    );

    std::vector<RawCandidate> extract(
        const std::string& content,
        const std::string& prompt,
        std::optional<double> temperature = std::nullopt,
        const std::vector<NuggetType>& types = {},
        const CancellationToken* cancel = nullptr
    ) override;

    std::string provider_id() const override { return "openai"; }
    std::string get_model() const override { return config_.model; }
    bool is_configured() const override { return !config_.api_key.empty(); }
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }

    /**
     * @brief Build JSON payload for chat completion
     */
    std::string build_chat_payload(const std::vector<Message>& messages,
                                   double temperature) const;

    /**
     * @brief Parse OpenAI API response
     *
     * @throws ProviderError (Structural) when choices/message/content is missing
     */
    LLMResponse parse_response(const std::string& response_json) const;

private:
    /**
     * @brief Make HTTP POST request to OpenAI API
     */
    std::string make_request(
        const std::string& endpoint,
        const std::string& json_payload,
        const CancellationToken* cancel
    );
};

// ============================================================================
// Gemini Provider
// ============================================================================

/**
 * @brief Google Gemini generateContent provider with a response schema
 */
class GeminiProvider : public LLMProvider {
public:
    /**
     * @brief Constructor
     *
     * @param api_key Gemini API key
     * @param model Model name (default: gemini-2.5-flash)
     */
    explicit GeminiProvider(
        const std::string& api_key,
        const std::string& model = "gemini-2.5-flash"
    );

    std::vector<RawCandidate> extract(
        const std::string& content,
        const std::string& prompt,
        std::optional<double> temperature = std::nullopt,
        const std::vector<NuggetType>& types = {},
        const CancellationToken* cancel = nullptr
    ) override;

    std::string provider_id() const override { return "gemini"; }
    std::string get_model() const override { return config_.model; }
    bool is_configured() const override { return !config_.api_key.empty(); }
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }

    /**
     * @brief Build JSON payload for Gemini API
     */
    std::string build_gemini_payload(const std::string& content,
                                     const std::string& prompt,
                                     double temperature,
                                     const std::vector<NuggetType>& types) const;

    /**
     * @brief Parse Gemini API response
     *
     * @throws ProviderError (Structural) when no candidate text is present
     */
    LLMResponse parse_response(const std::string& response_json) const;

private:
    /**
     * @brief Make HTTP POST request to Gemini API
     */
    std::string make_request(
        const std::string& endpoint,
        const std::string& json_payload,
        const CancellationToken* cancel
    );
};

// ============================================================================
// LLM Provider Factory
// ============================================================================

/**
 * @brief Factory for creating LLM providers
 */
class LLMProviderFactory {
public:
    enum class ProviderType {
        OpenAI,
        Gemini
    };

    /**
     * @brief Create LLM provider from type
     */
    static std::unique_ptr<LLMProvider> create(
        ProviderType type,
        const LLMConfig& config
    );

    /**
     * @brief Create provider from string name
     *
     * @param provider_name "openai" or "gemini" (case-insensitive)
     * @throws std::invalid_argument for any other name
     */
    static std::unique_ptr<LLMProvider> create(
        const std::string& provider_name,
        const LLMConfig& config
    );

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - NUGGET_LLM_PROVIDER (openai/gemini, default gemini)
     * - NUGGET_OPENAI_API_KEY or OPENAI_API_KEY
     * - NUGGET_GEMINI_API_KEY or GEMINI_API_KEY
     * - NUGGET_LLM_MODEL (optional)
     *
     * @return Unique pointer to provider, or nullptr if not configured
     */
    static std::unique_ptr<LLMProvider> create_from_env();

    /**
     * @brief Create provider from JSON config file
     *
     * Tries the given path, then .nugget_config.json in the current
     * directory and one and two levels up, then the environment.
     *
     * Config file format:
     * {
     *   "provider": "openai" or "gemini",
     *   "api_key": "your-key",
     *   "model": "gpt-4o-mini" or "gemini-2.5-flash",
     *   "temperature": 0.7,
     *   "max_tokens": 8192
     * }
     *
     * @return Unique pointer to provider, or nullptr if not configured
     */
    static std::unique_ptr<LLMProvider> create_from_config_file(
        const std::string& config_path = ""
    );

    /**
     * @brief Default model for a provider name
     */
    static std::string default_model(const std::string& provider_name);

    /**
     * @brief Order provider names by fallback preference
     *
     * gemini, openai, anthropic, openrouter; unknown names keep their
     * relative order after those.
     */
    static std::vector<std::string> order_by_fallback_priority(
        const std::vector<std::string>& provider_names
    );
};

// ============================================================================
// Prompt Templates
// ============================================================================

/**
 * @brief Prompt and schema templates for nugget extraction
 */
class PromptTemplates {
public:
    /**
     * @brief Default extraction prompt used when the caller supplies none
     */
    static std::string default_extraction_prompt();

    /**
     * @brief Format instructions for JSON output restricted to the types
     */
    static std::string json_format_instructions(const std::vector<NuggetType>& types);

    /**
     * @brief Gemini responseSchema for the selected types (all when empty)
     */
    static nlohmann::json response_schema(const std::vector<NuggetType>& types);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Shorten content to at most max_length bytes
 *
 * Cuts after the last sentence terminator (. ! ?) that fits, falling back
 * to a hard cut on a UTF-8 boundary. The kept text is a literal prefix.
 */
std::string truncate_content(const std::string& content, size_t max_length);

/**
 * @brief Read an environment variable, empty when unset
 */
std::string get_env_value(const std::string& env_var_name);

} // namespace nugget
