#include "llm/llm_provider.hpp"
#include "llm/response_parser.hpp"
#include "text/text_normalize.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iostream>
#include <fstream>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>

using json = nlohmann::json;

namespace nugget {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL progress callback; a non-zero return aborts the transfer
int cancel_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->is_cancelled()) ? 1 : 0;
}

// Pull the human-readable message out of an API error body
std::string extract_error_message(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.contains("error")) {
            const auto& error = j["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
            if (error.is_string()) {
                return error.get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }

    const size_t max_length = 500;
    return body.size() > max_length ? body.substr(0, max_length) + "..." : body;
}

// Make HTTP POST request with CURL
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds,
    const std::string& provider_id,
    const CancellationToken* cancel
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ProviderError(ErrorCategory::Unknown, "Failed to initialize CURL", 0, provider_id);
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    // The per-call deadline, when there is one, also bounds the transfer
    long timeout_ms = static_cast<long>(timeout_seconds) * 1000L;
    if (cancel) {
        if (auto remaining = cancel->remaining()) {
            long left = std::max(1L, static_cast<long>(remaining->count()));
            timeout_ms = timeout_ms > 0 ? std::min(timeout_ms, left) : left;
        }
    }
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancel_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);

        if (res == CURLE_ABORTED_BY_CALLBACK ||
            (res == CURLE_OPERATION_TIMEDOUT && cancel && cancel->is_cancelled())) {
            throw ProviderError(ErrorCategory::Cancelled, "Request cancelled", 0, provider_id);
        }
        throw ProviderError(ErrorCategory::Transient,
                            "Network error: CURL request failed: " + error, 0, provider_id);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        std::string message = "HTTP " + std::to_string(http_code) + ": " +
                              extract_error_message(response);
        int status = static_cast<int>(http_code);
        throw ProviderError(classify_error(status, message), message, status, provider_id);
    }

    return response;
}

json parse_api_body(const std::string& body, const std::string& provider_id) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProviderError(ErrorCategory::Structural,
                            std::string("Malformed API response: ") + e.what(), 0, provider_id);
    }
}

void throw_if_api_error(const json& j, const std::string& provider_id) {
    if (!j.contains("error")) return;

    std::string message = extract_error_message(j.dump());
    int status = 0;
    if (j["error"].is_object() && j["error"].contains("code") && j["error"]["code"].is_number_integer()) {
        status = j["error"]["code"].get<int>();
    }
    throw ProviderError(classify_error(status, message), message, status, provider_id);
}

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

// ============================================================================
// LLMProvider Base Class
// ============================================================================

void LLMProvider::require_configured() const {
    if (!is_configured()) {
        throw ProviderError(ErrorCategory::AuthConfig,
                            "API key not configured for " + provider_id(),
                            0, provider_id());
    }
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIProvider::OpenAIProvider(const std::string& api_key, const std::string& model) {
    config_.api_key = api_key;
    config_.model = model;
    config_.api_base_url = "https://api.openai.com/v1";
}

std::string OpenAIProvider::make_request(
    const std::string& endpoint,
    const std::string& json_payload,
    const CancellationToken* cancel
) {
    std::string url = config_.api_base_url + endpoint;

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };

    return http_post(url, json_payload, headers, config_.timeout_seconds, provider_id(), cancel);
}

std::string OpenAIProvider::build_chat_payload(const std::vector<Message>& messages,
                                               double temperature) const {
    json j;
    j["model"] = config_.model;
    j["temperature"] = temperature;
    j["max_tokens"] = config_.max_tokens;
    j["response_format"] = {{"type", "json_object"}};

    json messages_array = json::array();
    for (const auto& msg : messages) {
        messages_array.push_back({
            {"role", msg.role_string()},
            {"content", msg.content}
        });
    }
    j["messages"] = messages_array;

    return j.dump();
}

LLMResponse OpenAIProvider::parse_response(const std::string& response_json) const {
    json j = parse_api_body(response_json, provider_id());
    throw_if_api_error(j, provider_id());

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty() ||
        !j["choices"][0].contains("message") ||
        !j["choices"][0]["message"].contains("content") ||
        !j["choices"][0]["message"]["content"].is_string()) {
        throw ProviderError(ErrorCategory::Structural,
                            "Invalid response format: missing choices[0].message.content",
                            0, provider_id());
    }

    LLMResponse response;
    response.content = j["choices"][0]["message"]["content"].get<std::string>();
    response.model = j.value("model", config_.model);

    if (j.contains("usage") && j["usage"].is_object()) {
        response.prompt_tokens = j["usage"].value("prompt_tokens", 0);
        response.completion_tokens = j["usage"].value("completion_tokens", 0);
        response.total_tokens = j["usage"].value("total_tokens", 0);
    }

    return response;
}

std::vector<RawCandidate> OpenAIProvider::extract(
    const std::string& content,
    const std::string& prompt,
    std::optional<double> temperature,
    const std::vector<NuggetType>& types,
    const CancellationToken* cancel
) {
    require_configured();

    std::vector<Message> messages = {
        Message(Message::Role::System,
                prompt + "\n\n" + PromptTemplates::json_format_instructions(types)),
        Message(Message::Role::User, content)
    };

    std::string payload = build_chat_payload(messages, temperature.value_or(config_.temperature));

    if (config_.verbose) {
        std::cout << "OpenAI API Request to " << config_.model << std::endl;
    }

    auto start_time = std::chrono::steady_clock::now();
    std::string response_str = make_request("/chat/completions", payload, cancel);
    LLMResponse response = parse_response(response_str);
    response.latency_ms = elapsed_ms_since(start_time);

    if (config_.verbose) {
        std::cout << "  Tokens: " << response.total_tokens
                  << " (prompt: " << response.prompt_tokens
                  << ", completion: " << response.completion_tokens << ")" << std::endl;
        std::cout << "  Latency: " << response.latency_ms << " ms" << std::endl;
    }

    return parse_candidates_json(response.content, provider_id());
}

// ============================================================================
// Gemini Provider
// ============================================================================

GeminiProvider::GeminiProvider(const std::string& api_key, const std::string& model) {
    config_.api_key = api_key;
    config_.model = model;
    config_.api_base_url = "https://generativelanguage.googleapis.com/v1beta";
}

std::string GeminiProvider::make_request(
    const std::string& endpoint,
    const std::string& json_payload,
    const CancellationToken* cancel
) {
    std::string url = config_.api_base_url + endpoint + "?key=" + config_.api_key;

    std::vector<std::string> headers = {
        "Content-Type: application/json"
    };

    return http_post(url, json_payload, headers, config_.timeout_seconds, provider_id(), cancel);
}

std::string GeminiProvider::build_gemini_payload(const std::string& content,
                                                 const std::string& prompt,
                                                 double temperature,
                                                 const std::vector<NuggetType>& types) const {
    json j;

    j["system_instruction"] = {
        {"parts", json::array({{{"text", prompt}}})}
    };

    j["contents"] = json::array({
        {
            {"role", "user"},
            {"parts", json::array({{{"text", content}}})}
        }
    });

    j["generationConfig"] = {
        {"temperature", temperature},
        {"maxOutputTokens", config_.max_tokens},
        {"responseMimeType", "application/json"},
        {"responseSchema", PromptTemplates::response_schema(types)}
    };

    return j.dump();
}

LLMResponse GeminiProvider::parse_response(const std::string& response_json) const {
    json j = parse_api_body(response_json, provider_id());
    throw_if_api_error(j, provider_id());

    const json* text = nullptr;
    if (j.contains("candidates") && j["candidates"].is_array() && !j["candidates"].empty()) {
        const auto& candidate = j["candidates"][0];
        if (candidate.contains("content") && candidate["content"].contains("parts") &&
            candidate["content"]["parts"].is_array() && !candidate["content"]["parts"].empty() &&
            candidate["content"]["parts"][0].contains("text")) {
            text = &candidate["content"]["parts"][0]["text"];
        }
    }

    if (!text || !text->is_string()) {
        throw ProviderError(ErrorCategory::Structural,
                            "Invalid response format: no candidate text in Gemini response",
                            0, provider_id());
    }

    LLMResponse response;
    response.content = text->get<std::string>();
    response.model = config_.model;

    if (j.contains("usageMetadata") && j["usageMetadata"].is_object()) {
        response.prompt_tokens = j["usageMetadata"].value("promptTokenCount", 0);
        response.completion_tokens = j["usageMetadata"].value("candidatesTokenCount", 0);
        response.total_tokens = j["usageMetadata"].value("totalTokenCount", 0);
    }

    return response;
}

std::vector<RawCandidate> GeminiProvider::extract(
    const std::string& content,
    const std::string& prompt,
    std::optional<double> temperature,
    const std::vector<NuggetType>& types,
    const CancellationToken* cancel
) {
    require_configured();

    std::string payload = build_gemini_payload(
        content, prompt, temperature.value_or(config_.temperature), types
    );

    if (config_.verbose) {
        std::cout << "Gemini API Request to " << config_.model << std::endl;
    }

    auto start_time = std::chrono::steady_clock::now();
    std::string endpoint = "/models/" + config_.model + ":generateContent";
    std::string response_str = make_request(endpoint, payload, cancel);
    LLMResponse response = parse_response(response_str);
    response.latency_ms = elapsed_ms_since(start_time);

    if (config_.verbose) {
        std::cout << "  Tokens: " << response.total_tokens
                  << " (prompt: " << response.prompt_tokens
                  << ", completion: " << response.completion_tokens << ")" << std::endl;
        std::cout << "  Latency: " << response.latency_ms << " ms" << std::endl;
    }

    return parse_candidates_json(response.content, provider_id());
}

// ============================================================================
// LLM Provider Factory
// ============================================================================

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    ProviderType type,
    const LLMConfig& config
) {
    std::unique_ptr<LLMProvider> provider;

    switch (type) {
        case ProviderType::OpenAI:
            provider = std::make_unique<OpenAIProvider>(config.api_key);
            break;
        case ProviderType::Gemini:
            provider = std::make_unique<GeminiProvider>(config.api_key);
            break;
        default:
            throw std::invalid_argument("Unknown provider type");
    }

    // Keep the provider's base URL unless the config overrides it
    LLMConfig merged = config;
    LLMConfig defaults = provider->get_config();
    if (merged.model.empty()) merged.model = defaults.model;
    if (merged.api_base_url.empty()) merged.api_base_url = defaults.api_base_url;
    provider->set_config(merged);

    return provider;
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    const std::string& provider_name,
    const LLMConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "openai") {
        return create(ProviderType::OpenAI, config);
    } else if (name_lower == "gemini") {
        return create(ProviderType::Gemini, config);
    } else {
        throw std::invalid_argument("Unknown provider name: " + provider_name);
    }
}

std::string LLMProviderFactory::default_model(const std::string& provider_name) {
    if (provider_name == "openai") return "gpt-4o-mini";
    if (provider_name == "gemini") return "gemini-2.5-flash";
    return "";
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create_from_env() {
    std::string provider = get_env_value("NUGGET_LLM_PROVIDER");
    if (provider.empty()) {
        provider = "gemini";
    }

    LLMConfig config;

    if (provider == "openai") {
        config.api_key = get_env_value("NUGGET_OPENAI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("OPENAI_API_KEY");
        }
    } else if (provider == "gemini") {
        config.api_key = get_env_value("NUGGET_GEMINI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("GEMINI_API_KEY");
        }
    }

    config.model = get_env_value("NUGGET_LLM_MODEL");
    if (config.model.empty()) {
        config.model = default_model(provider);
    }

    if (config.api_key.empty()) {
        return nullptr;
    }

    return create(provider, config);
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create_from_config_file(
    const std::string& config_path
) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".nugget_config.json");         // Current directory
    paths_to_try.push_back("../.nugget_config.json");      // From build/
    paths_to_try.push_back("../../.nugget_config.json");   // From build/bin/

    std::ifstream file;
    std::string found_path;

    for (const auto& path : paths_to_try) {
        file.open(path);
        if (file.is_open()) {
            found_path = path;
            break;
        }
        file.clear();
    }

    if (!file.is_open()) {
        return create_from_env();
    }

    json config_json;
    try {
        file >> config_json;
    } catch (const json::parse_error& e) {
        std::cerr << "Ignoring unreadable config " << found_path << ": " << e.what() << std::endl;
        return create_from_env();
    }

    if (!config_json.is_object() || !config_json.contains("provider")) {
        return create_from_env();
    }

    std::string provider = config_json.value("provider", "");

    LLMConfig config;
    config.api_key = config_json.value("api_key", "");
    config.model = config_json.value("model", default_model(provider));
    config.temperature = config_json.value("temperature", config.temperature);
    config.max_tokens = config_json.value("max_tokens", config.max_tokens);
    config.timeout_seconds = config_json.value("timeout_seconds", config.timeout_seconds);
    config.verbose = config_json.value("verbose", config.verbose);

    if (config.api_key.empty()) {
        return create_from_env();
    }

    return create(provider, config);
}

std::vector<std::string> LLMProviderFactory::order_by_fallback_priority(
    const std::vector<std::string>& provider_names
) {
    static const std::vector<std::string> priority = {"gemini", "openai", "anthropic", "openrouter"};

    auto rank = [](const std::string& name) {
        auto it = std::find(priority.begin(), priority.end(), name);
        return static_cast<size_t>(std::distance(priority.begin(), it));
    };

    std::vector<std::string> ordered = provider_names;
    std::stable_sort(ordered.begin(), ordered.end(), [&](const std::string& a, const std::string& b) {
        return rank(a) < rank(b);
    });
    return ordered;
}

// ============================================================================
// Prompt Templates
// ============================================================================

std::string PromptTemplates::default_extraction_prompt() {
    return R"(You are an expert at finding "golden nuggets" in long-form text: short passages
that a curious, technically minded reader would want to save.

Golden nugget types:
- tool: a concrete tool, technique or method the reader can apply
- media: a book, article, video, podcast or other resource worth following up
- explanation: an "aha" explanation that makes a concept click
- analogy: a comparison or metaphor that clarifies an idea
- model: a mental model or framework for thinking

Guidelines:
- Quote each passage VERBATIM from the text; do not paraphrase, shorten or fix it
- Prefer complete sentences; a nugget may span several sentences
- Skip generic advice, filler and promotional content
- Set confidence based on how clearly the passage fits its type
)";
}

std::string PromptTemplates::json_format_instructions(const std::vector<NuggetType>& types) {
    const auto& selected = types.empty() ? all_nugget_types() : types;

    std::string type_list;
    for (size_t i = 0; i < selected.size(); ++i) {
        if (i > 0) type_list += ", ";
        type_list += "\"" + nugget_type_to_string(selected[i]) + "\"";
    }

    return R"(IMPORTANT:
- Respond ONLY with valid JSON (no markdown, no explanation)
- Use exactly this shape:
  {"golden_nuggets": [{"type": "...", "fullContent": "...", "confidence": 0.9}]}
- "type" must be one of: )" + type_list + R"(
- "fullContent" must be copied verbatim from the text
- "confidence" is a number between 0.0 and 1.0
- Return {"golden_nuggets": []} when nothing qualifies
- Ensure JSON is complete and properly closed with all brackets)";
}

json PromptTemplates::response_schema(const std::vector<NuggetType>& types) {
    const auto& selected = types.empty() ? all_nugget_types() : types;

    json type_enum = json::array();
    for (auto type : selected) {
        type_enum.push_back(nugget_type_to_string(type));
    }

    json item = {
        {"type", "OBJECT"},
        {"properties", {
            {"type", {{"type", "STRING"}, {"enum", type_enum}}},
            {"fullContent", {{"type", "STRING"}}},
            {"confidence", {{"type", "NUMBER"}}}
        }},
        {"required", json::array({"type", "fullContent", "confidence"})},
        {"propertyOrdering", json::array({"type", "fullContent", "confidence"})}
    };

    return {
        {"type", "OBJECT"},
        {"properties", {
            {"golden_nuggets", {{"type", "ARRAY"}, {"items", item}}}
        }},
        {"required", json::array({"golden_nuggets"})}
    };
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string truncate_content(const std::string& content, size_t max_length) {
    if (content.size() <= max_length) {
        return content;
    }

    // Last terminator whose sentence still fits
    for (size_t i = max_length; i > 0; --i) {
        char c = content[i - 1];
        if ((c == '.' || c == '!' || c == '?') &&
            (i == content.size() || is_space(content[i]))) {
            return content.substr(0, i);
        }
    }

    size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return content.substr(0, cut);
}

std::string get_env_value(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace nugget
