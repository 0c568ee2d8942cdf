#include "pipeline/extraction_orchestrator.hpp"
#include "llm/response_parser.hpp"
#include "text/text_normalize.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <thread>
#include <random>
#include <cmath>
#include <algorithm>
#include <sys/stat.h>

using json = nlohmann::json;

namespace nugget {

namespace {

const std::vector<std::string> kSupportedProviders = {"openai", "gemini"};

bool is_supported_provider(const std::string& name) {
    return std::find(kSupportedProviders.begin(), kSupportedProviders.end(), name) !=
           kSupportedProviders.end();
}

std::string api_key_from_env(const std::string& provider) {
    std::string upper = provider;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    std::string key = get_env_value("NUGGET_" + upper + "_API_KEY");
    if (key.empty()) {
        key = get_env_value(upper + "_API_KEY");
    }
    return key;
}

std::vector<std::string> split_provider_list(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string name = to_lower_ascii(trim(item));
        if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

double jitter_draw() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(gen);
}

LLMConfig make_llm_config(const OrchestratorConfig& config,
                          const std::string& api_key,
                          const std::string& model) {
    LLMConfig llm;
    llm.api_key = api_key;
    llm.model = model;
    llm.temperature = config.llm_temperature;
    llm.max_tokens = config.llm_max_tokens;
    llm.timeout_seconds = config.llm_timeout_seconds;
    llm.verbose = config.verbose;
    return llm;
}

bool is_fatal(ErrorCategory category) {
    return category == ErrorCategory::Structural ||
           category == ErrorCategory::AuthConfig ||
           category == ErrorCategory::Cancelled;
}

} // anonymous namespace

// ============================================================================
// OrchestratorConfig
// ============================================================================

OrchestratorConfig OrchestratorConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    OrchestratorConfig config;

    // LLM config - support both formats:
    // Full format: llm_provider, llm_api_key, llm_model
    // Short format: provider, api_key, model (from .nugget_config.json)
    if (j.contains("llm_provider")) {
        config.llm_provider = j["llm_provider"];
    } else if (j.contains("provider")) {
        config.llm_provider = j["provider"];
    }

    if (j.contains("llm_api_key")) {
        config.llm_api_key = j["llm_api_key"];
    } else if (j.contains("api_key")) {
        config.llm_api_key = j["api_key"];
    }

    if (j.contains("llm_model")) {
        config.llm_model = j["llm_model"];
    } else if (j.contains("model")) {
        config.llm_model = j["model"];
    }

    if (j.contains("llm_temperature")) {
        config.llm_temperature = j["llm_temperature"];
    } else if (j.contains("temperature")) {
        config.llm_temperature = j["temperature"];
    }

    if (j.contains("llm_max_tokens")) {
        config.llm_max_tokens = j["llm_max_tokens"];
    } else if (j.contains("max_tokens")) {
        config.llm_max_tokens = j["max_tokens"];
    }

    if (j.contains("llm_timeout_seconds")) {
        config.llm_timeout_seconds = j["llm_timeout_seconds"];
    } else if (j.contains("timeout_seconds")) {
        config.llm_timeout_seconds = j["timeout_seconds"];
    }

    if (j.contains("fallback_providers")) {
        for (const auto& entry : j["fallback_providers"]) {
            FallbackProvider fallback;
            fallback.provider = entry.value("provider", "");
            fallback.api_key = entry.value("api_key", "");
            fallback.model = entry.value("model", "");
            if (fallback.api_key.empty()) {
                fallback.api_key = api_key_from_env(fallback.provider);
            }
            config.fallback_providers.push_back(fallback);
        }
    }

    // Retry config
    if (j.contains("max_attempts")) config.max_attempts = j["max_attempts"];
    if (j.contains("base_delay_ms")) config.base_delay_ms = j["base_delay_ms"];
    if (j.contains("rate_limit_multiplier")) config.rate_limit_multiplier = j["rate_limit_multiplier"];
    if (j.contains("jitter_fraction")) config.jitter_fraction = j["jitter_fraction"];
    if (j.contains("max_delay_ms")) config.max_delay_ms = j["max_delay_ms"];
    if (j.contains("fallback_after_failures")) config.fallback_after_failures = j["fallback_after_failures"];

    // Content and cache config
    if (j.contains("max_content_length")) config.max_content_length = j["max_content_length"];
    if (j.contains("enable_cache")) config.enable_cache = j["enable_cache"];
    if (j.contains("cache_capacity")) config.cache_capacity = j["cache_capacity"];
    if (j.contains("cache_ttl_seconds")) config.cache_ttl_seconds = j["cache_ttl_seconds"];

    // Validation config
    if (j.contains("min_confidence_threshold")) {
        config.validation.min_confidence_threshold = j["min_confidence_threshold"];
    }
    if (j.contains("fuzzy_tolerance")) config.validation.fuzzy_tolerance = j["fuzzy_tolerance"];
    if (j.contains("min_window_size")) config.validation.min_window_size = j["min_window_size"];
    if (j.contains("partial_prefix_length")) {
        config.validation.partial_prefix_length = j["partial_prefix_length"];
    }
    config.boundary.tolerance = config.validation.fuzzy_tolerance;
    config.boundary.min_confidence_threshold = config.validation.min_confidence_threshold;

    // Anchor config
    if (j.contains("max_start_words")) config.boundary.max_start_words = j["max_start_words"];
    if (j.contains("max_end_words")) config.boundary.max_end_words = j["max_end_words"];

    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

void OrchestratorConfig::to_json_file(const std::string& path) const {
    json j;

    // LLM config
    j["llm_provider"] = llm_provider;
    j["llm_api_key"] = "***REDACTED***";
    j["llm_model"] = llm_model;
    j["llm_temperature"] = llm_temperature;
    j["llm_max_tokens"] = llm_max_tokens;
    j["llm_timeout_seconds"] = llm_timeout_seconds;

    json fallbacks = json::array();
    for (const auto& fallback : fallback_providers) {
        fallbacks.push_back({
            {"provider", fallback.provider},
            {"api_key", "***REDACTED***"},
            {"model", fallback.model}
        });
    }
    j["fallback_providers"] = fallbacks;

    // Retry config
    j["max_attempts"] = max_attempts;
    j["base_delay_ms"] = base_delay_ms;
    j["rate_limit_multiplier"] = rate_limit_multiplier;
    j["jitter_fraction"] = jitter_fraction;
    j["max_delay_ms"] = max_delay_ms;
    j["fallback_after_failures"] = fallback_after_failures;

    // Content and cache config
    j["max_content_length"] = max_content_length;
    j["enable_cache"] = enable_cache;
    j["cache_capacity"] = cache_capacity;
    j["cache_ttl_seconds"] = cache_ttl_seconds;

    // Validation and anchor config
    j["min_confidence_threshold"] = validation.min_confidence_threshold;
    j["fuzzy_tolerance"] = validation.fuzzy_tolerance;
    j["min_window_size"] = validation.min_window_size;
    j["partial_prefix_length"] = validation.partial_prefix_length;
    j["max_start_words"] = boundary.max_start_words;
    j["max_end_words"] = boundary.max_end_words;

    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

OrchestratorConfig OrchestratorConfig::from_environment() {
    OrchestratorConfig config;

    std::string provider = to_lower_ascii(get_env_value("NUGGET_LLM_PROVIDER"));
    if (!provider.empty()) config.llm_provider = provider;

    config.llm_api_key = api_key_from_env(config.llm_provider);

    std::string model = get_env_value("NUGGET_LLM_MODEL");
    config.llm_model = model.empty() ? LLMProviderFactory::default_model(config.llm_provider) : model;

    std::vector<std::string> fallback_names = LLMProviderFactory::order_by_fallback_priority(
        split_provider_list(get_env_value("NUGGET_FALLBACK_PROVIDER"))
    );

    for (const auto& name : fallback_names) {
        if (name == config.llm_provider) continue;

        FallbackProvider fallback;
        fallback.provider = name;
        fallback.api_key = api_key_from_env(name);
        fallback.model = LLMProviderFactory::default_model(name);
        config.fallback_providers.push_back(fallback);
    }

    return config;
}

bool OrchestratorConfig::validate(std::string& error_message) const {
    if (llm_api_key.empty()) {
        error_message = "LLM API key is required";
        return false;
    }

    if (!is_supported_provider(llm_provider)) {
        error_message = "LLM provider must be 'openai' or 'gemini'";
        return false;
    }

    for (const auto& fallback : fallback_providers) {
        if (!is_supported_provider(fallback.provider)) {
            error_message = "Unsupported fallback provider: " + fallback.provider;
            return false;
        }
        if (fallback.api_key.empty()) {
            error_message = "API key is required for fallback provider " + fallback.provider;
            return false;
        }
    }

    if (max_attempts < 1) {
        error_message = "max_attempts must be at least 1";
        return false;
    }

    if (base_delay_ms < 0.0 || max_delay_ms < base_delay_ms) {
        error_message = "Backoff delays must satisfy 0 <= base_delay_ms <= max_delay_ms";
        return false;
    }

    if (jitter_fraction < 0.0 || jitter_fraction > 1.0) {
        error_message = "jitter_fraction must be between 0.0 and 1.0";
        return false;
    }

    // A rate-limit wait must outlast any jittered transient wait for the same attempt
    if (rate_limit_multiplier <= 1.0 + jitter_fraction) {
        error_message = "rate_limit_multiplier must be greater than 1.0 + jitter_fraction";
        return false;
    }

    if (fallback_after_failures < 1) {
        error_message = "fallback_after_failures must be at least 1";
        return false;
    }

    if (max_content_length == 0) {
        error_message = "max_content_length must be positive";
        return false;
    }

    if (enable_cache && (cache_capacity == 0 || cache_ttl_seconds <= 0)) {
        error_message = "Cache capacity and TTL must be positive";
        return false;
    }

    // A zero threshold would mark unmatched passages as validated
    if (validation.min_confidence_threshold <= 0.0 || validation.min_confidence_threshold > 1.0) {
        error_message = "min_confidence_threshold must be in (0.0, 1.0]";
        return false;
    }

    if (validation.fuzzy_tolerance < 0.0 || validation.fuzzy_tolerance > 1.0) {
        error_message = "fuzzy_tolerance must be between 0.0 and 1.0";
        return false;
    }

    if (boundary.max_start_words == 0 || boundary.max_end_words == 0) {
        error_message = "Anchor word counts must be positive";
        return false;
    }

    return true;
}

// ============================================================================
// ExtractionReport
// ============================================================================

void ExtractionReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Extraction Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Provider: " << (provider_id.empty() ? "(none)" : provider_id)
              << (from_cache ? " (cached)" : "") << "\n";
    std::cout << "  Attempts: " << attempts << "\n";
    std::cout << "  Elapsed: " << elapsed_ms << " ms\n\n";

    std::cout << "Golden Nuggets:\n";
    std::cout << "  Total: " << total_count << "\n";
    std::cout << "  Validated: " << validated_count << "\n";
    std::cout << "  Average validation score: " << average_validation_score << "\n\n";

    for (size_t i = 0; i < nuggets.size(); ++i) {
        const auto& n = nuggets[i];
        std::cout << "  [" << (i + 1) << "] " << nugget_type_to_string(n.type)
                  << " (" << match_method_to_string(n.match_method)
                  << ", score " << n.validation_score << ")\n";
        std::cout << "      start: \"" << n.start_anchor << "\"\n";
        std::cout << "      end:   \"" << n.end_anchor << "\"\n";
    }

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json ExtractionReport::to_json() const {
    json j;

    json nugget_array = json::array();
    for (const auto& n : nuggets) {
        nugget_array.push_back(n.to_json());
    }
    j["golden_nuggets"] = nugget_array;

    j["total_count"] = total_count;
    j["validated_count"] = validated_count;
    j["average_validation_score"] = average_validation_score;
    j["elapsed_ms"] = elapsed_ms;
    j["provider_id"] = provider_id;
    j["attempts"] = attempts;
    j["from_cache"] = from_cache;

    return j;
}

// ============================================================================
// Ensemble Results
// ============================================================================

json ConsensusNugget::to_json() const {
    json j = nugget.to_json();
    j["supportingRuns"] = supporting_runs;
    j["groupSize"] = group_size;
    j["cohesion"] = cohesion;
    return j;
}

void EnsembleReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Ensemble Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Runs: " << successful_runs << "/" << total_runs << " succeeded\n";
    std::cout << "  Attempts: " << attempts << "\n";
    std::cout << "  Elapsed: " << elapsed_ms << " ms\n\n";

    std::cout << "Consensus:\n";
    std::cout << "  Candidates: " << candidate_count << "\n";
    std::cout << "  Duplicates removed: " << duplicates_removed << "\n";
    std::cout << "  Nuggets: " << nuggets.size() << " (" << validated_count << " validated)\n";
    std::cout << "  Average validation score: " << average_validation_score << "\n\n";

    for (size_t i = 0; i < nuggets.size(); ++i) {
        const auto& n = nuggets[i].nugget;
        std::cout << "  [" << (i + 1) << "] " << nugget_type_to_string(n.type)
                  << " (" << nuggets[i].supporting_runs << "/" << successful_runs << " runs, "
                  << match_method_to_string(n.match_method) << ")\n";
        std::cout << "      start: \"" << n.start_anchor << "\"\n";
        std::cout << "      end:   \"" << n.end_anchor << "\"\n";
    }

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json EnsembleReport::to_json() const {
    json j;

    json nugget_array = json::array();
    for (const auto& n : nuggets) {
        nugget_array.push_back(n.to_json());
    }
    j["golden_nuggets"] = nugget_array;

    j["total_runs"] = total_runs;
    j["successful_runs"] = successful_runs;
    j["candidate_count"] = candidate_count;
    j["duplicates_removed"] = duplicates_removed;
    j["validated_count"] = validated_count;
    j["average_validation_score"] = average_validation_score;
    j["elapsed_ms"] = elapsed_ms;
    j["attempts"] = attempts;

    return j;
}

// ============================================================================
// ExtractionOrchestrator
// ============================================================================

ExtractionOrchestrator::ExtractionOrchestrator(
    std::vector<std::unique_ptr<LLMProvider>> providers,
    const OrchestratorConfig& config
) : config_(config), providers_(std::move(providers)) {
    if (providers_.empty()) {
        throw std::invalid_argument("At least one LLM provider is required");
    }
    for (const auto& provider : providers_) {
        if (!provider) {
            throw std::invalid_argument("LLM provider must not be null");
        }
    }

    if (config_.enable_cache) {
        cache_ = std::make_shared<ResponseCache>(
            config_.cache_capacity, std::chrono::seconds(config_.cache_ttl_seconds)
        );
    }
}

ExtractionOrchestrator::ExtractionOrchestrator(const OrchestratorConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid orchestrator configuration: " + error);
    }

    providers_.push_back(LLMProviderFactory::create(
        config_.llm_provider, make_llm_config(config_, config_.llm_api_key, config_.llm_model)
    ));

    for (const auto& fallback : config_.fallback_providers) {
        providers_.push_back(LLMProviderFactory::create(
            fallback.provider, make_llm_config(config_, fallback.api_key, fallback.model)
        ));
    }

    if (config_.enable_cache) {
        cache_ = std::make_shared<ResponseCache>(
            config_.cache_capacity, std::chrono::seconds(config_.cache_ttl_seconds)
        );
    }

    if (config_.verbose) {
        std::cout << "[Orchestrator] Providers:";
        for (const auto& id : provider_ids()) {
            std::cout << " " << id;
        }
        std::cout << std::endl;
    }
}

void ExtractionOrchestrator::set_retry_callback(RetryCallback callback) {
    retry_callback_ = std::move(callback);
}

void ExtractionOrchestrator::set_cache(std::shared_ptr<ResponseCache> cache) {
    cache_ = std::move(cache);
}

std::vector<std::string> ExtractionOrchestrator::provider_ids() const {
    std::vector<std::string> ids;
    for (const auto& provider : providers_) {
        ids.push_back(provider->provider_id());
    }
    return ids;
}

double ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory category,
                                                        int attempt,
                                                        const OrchestratorConfig& config,
                                                        double jitter_unit) {
    double base = config.base_delay_ms;
    double cap = config.max_delay_ms;
    if (category == ErrorCategory::RateLimit) {
        base *= config.rate_limit_multiplier;
        cap *= config.rate_limit_multiplier;
    }

    int exponent = std::max(0, attempt - 1);
    double delay = std::min(base * std::pow(2.0, exponent), cap);

    double unit = std::min(1.0, std::max(0.0, jitter_unit));
    return delay + unit * config.jitter_fraction * delay;
}

ExtractionReport ExtractionOrchestrator::extract_validated(
    const std::string& content,
    const std::string& prompt,
    const ExtractionOptions& options,
    const CancellationToken* cancel
) {
    check_options(options);

    auto start_time = std::chrono::steady_clock::now();
    std::string effective_prompt = prompt.empty() ? PromptTemplates::default_extraction_prompt() : prompt;

    std::string cache_key;
    if (cache_) {
        cache_key = ResponseCache::make_key(content, effective_prompt, options.selected_types);
        auto cached = cache_->get(cache_key);
        if (cached) {
            if (config_.verbose) {
                std::cout << "[Orchestrator] Cache hit (" << cached->size() << " candidates)" << std::endl;
            }
            ExtractionReport report = build_report(*cached, content, options);
            report.from_cache = true;
            report.elapsed_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start_time).count();
            return report;
        }
    }

    std::string payload = prepare_payload(content);

    RetryState state;
    state.provider_index = 0;
    state.provider_id = providers_[0]->provider_id();

    std::vector<RawCandidate> candidates = filter_candidates_by_type(
        call_providers(payload, effective_prompt, options, cancel, state),
        options.selected_types
    );

    if (cache_) {
        cache_->put(cache_key, candidates);
    }

    ExtractionReport report = build_report(candidates, content, options);
    report.provider_id = state.provider_id;
    report.attempts = state.attempt;
    report.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time).count();

    if (config_.verbose) {
        std::cout << "[Orchestrator] " << report.validated_count << "/" << report.total_count
                  << " nuggets validated via " << report.provider_id
                  << " in " << report.attempts << " attempt(s)" << std::endl;
    }

    return report;
}

EnsembleReport ExtractionOrchestrator::extract_ensemble(
    const std::string& content,
    const std::string& prompt,
    const ExtractionOptions& options,
    const EnsembleOptions& ensemble,
    const CancellationToken* cancel
) {
    check_options(options);
    if (ensemble.runs < 1) {
        throw std::invalid_argument("Ensemble needs at least one run");
    }
    if (ensemble.similarity_threshold <= 0.0 || ensemble.similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity_threshold must be in (0.0, 1.0]");
    }
    if (ensemble.min_supporting_runs < 1 || ensemble.min_supporting_runs > ensemble.runs) {
        throw std::invalid_argument("min_supporting_runs must be between 1 and the run count");
    }

    using Clock = std::chrono::steady_clock;
    const auto start_time = Clock::now();
    const bool has_deadline = options.timeout_ms > 0;
    const auto deadline = start_time + std::chrono::milliseconds(options.timeout_ms);

    std::string effective_prompt = prompt.empty() ? PromptTemplates::default_extraction_prompt() : prompt;
    std::string payload = prepare_payload(content);

    ExtractionOptions run_options = options;
    if (!run_options.temperature) {
        run_options.temperature = ensemble.default_temperature;
    }

    EnsembleReport report;
    report.total_runs = ensemble.runs;

    std::vector<std::vector<RawCandidate>> successful;
    std::optional<ExtractionError> last_failure;

    for (int run = 1; run <= ensemble.runs; ++run) {
        // The deadline covers the whole ensemble; each run gets what is left
        if (has_deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0) {
                if (config_.verbose) {
                    std::cerr << "[Ensemble] Deadline reached after " << (run - 1) << " run(s)" << std::endl;
                }
                break;
            }
            run_options.timeout_ms = static_cast<int>(left.count());
        }

        if (config_.verbose) {
            std::cout << "[Ensemble] Run " << run << "/" << ensemble.runs << std::endl;
        }

        RetryState state;
        state.provider_id = providers_[0]->provider_id();
        try {
            successful.push_back(filter_candidates_by_type(
                call_providers(payload, effective_prompt, run_options, cancel, state),
                options.selected_types
            ));
        } catch (const ExtractionError& e) {
            if (e.category() == ErrorCategory::Cancelled) {
                throw;
            }
            if (config_.verbose) {
                std::cerr << "[Ensemble] Run " << run << " failed: " << e.what() << std::endl;
            }
            last_failure = e;
        }
        report.attempts += state.attempt;
    }

    if (successful.empty()) {
        if (last_failure) {
            throw *last_failure;
        }
        RetryState state;
        state.provider_id = providers_[0]->provider_id();
        record_deadline(state, options.timeout_ms);
        throw make_error(state);
    }

    report.successful_runs = static_cast<int>(successful.size());
    for (const auto& candidates : successful) {
        report.candidate_count += static_cast<int>(candidates.size());
    }

    std::vector<ConsensusCandidate> consensus = build_consensus(
        successful, ensemble.similarity_threshold, ensemble.min_supporting_runs
    );

    std::vector<RawCandidate> representatives;
    for (const auto& group : consensus) {
        representatives.push_back(group.candidate);
        report.duplicates_removed += group.group_size - 1;
    }

    ExtractionReport resolved = build_report(representatives, content, options);
    for (size_t i = 0; i < consensus.size(); ++i) {
        ConsensusNugget nugget;
        nugget.nugget = resolved.nuggets[i];
        nugget.supporting_runs = consensus[i].supporting_runs;
        nugget.group_size = consensus[i].group_size;
        nugget.cohesion = consensus[i].cohesion;
        report.nuggets.push_back(std::move(nugget));
    }
    report.validated_count = resolved.validated_count;
    report.average_validation_score = resolved.average_validation_score;
    report.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start_time).count();

    if (config_.verbose) {
        std::cout << "[Ensemble] " << report.successful_runs << "/" << report.total_runs
                  << " runs succeeded, " << report.nuggets.size() << " consensus nugget(s) from "
                  << report.candidate_count << " candidate(s)" << std::endl;
    }

    return report;
}

void ExtractionOrchestrator::check_options(const ExtractionOptions& options) const {
    // Same range as min_confidence_threshold in OrchestratorConfig::validate
    if (options.validation_threshold &&
        (*options.validation_threshold <= 0.0 || *options.validation_threshold > 1.0)) {
        throw std::invalid_argument("validation_threshold must be in (0.0, 1.0]");
    }
    if (options.timeout_ms < 0) {
        throw std::invalid_argument("timeout_ms must not be negative");
    }
}

std::string ExtractionOrchestrator::prepare_payload(const std::string& content) const {
    if (content.size() <= config_.max_content_length) {
        return content;
    }

    std::string payload = truncate_content(content, config_.max_content_length);
    if (config_.verbose) {
        std::cout << "[Orchestrator] Content truncated from " << content.size()
                  << " to " << payload.size() << " bytes" << std::endl;
    }
    return payload;
}

std::vector<RawCandidate> ExtractionOrchestrator::call_providers(
    const std::string& content,
    const std::string& prompt,
    const ExtractionOptions& options,
    const CancellationToken* cancel,
    RetryState& state
) {
    using Clock = std::chrono::steady_clock;
    const bool has_deadline = options.timeout_ms > 0;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(options.timeout_ms);

    // Provider calls see the caller's token and the deadline together
    CancellationToken call_token(cancel, deadline);
    const CancellationToken* call_cancel = has_deadline ? &call_token : cancel;

    while (state.attempt < config_.max_attempts) {
        if (cancel && cancel->is_cancelled()) {
            throw make_cancelled_error(state, "Extraction cancelled");
        }
        if (has_deadline && Clock::now() >= deadline) {
            record_deadline(state, options.timeout_ms);
            break;
        }

        LLMProvider& provider = *providers_[state.provider_index];
        state.provider_id = provider.provider_id();
        ++state.attempt;

        if (config_.verbose) {
            std::cout << "[Orchestrator] Attempt " << state.attempt << "/" << config_.max_attempts
                      << " with " << state.provider_id << std::endl;
        }

        try {
            std::vector<RawCandidate> candidates = provider.extract(
                content, prompt, options.temperature, options.selected_types, call_cancel
            );
            state.consecutive_failures = 0;
            return candidates;
        } catch (const ProviderError& e) {
            std::string id = e.provider_id().empty() ? state.provider_id : e.provider_id();
            state.last_error.emplace(e.category(), e.what(), e.status_code(), id);
        } catch (const std::exception& e) {
            state.last_error.emplace(classify_error(0, e.what()), e.what(), 0, state.provider_id);
        }

        if (cancel && cancel->is_cancelled()) {
            throw make_cancelled_error(state, "Extraction cancelled");
        }

        // Nothing more is attempted once the deadline has passed, not even a fallback
        if (has_deadline && Clock::now() >= deadline) {
            record_deadline(state, options.timeout_ms);
            break;
        }

        ++state.consecutive_failures;
        const ErrorCategory category = state.last_error->category();

        if (config_.verbose) {
            std::cerr << "[Orchestrator] " << state.provider_id << " failed ("
                      << error_category_to_string(category) << "): "
                      << state.last_error->what() << std::endl;
        }

        if (is_fatal(category) || state.attempt >= config_.max_attempts) {
            break;
        }

        bool has_fallback = state.provider_index + 1 < providers_.size();
        if (has_fallback && (is_fallback_eligible(category) ||
                             state.consecutive_failures >= config_.fallback_after_failures)) {
            std::string previous = state.provider_id;
            ++state.provider_index;
            state.consecutive_failures = 0;
            state.provider_id = providers_[state.provider_index]->provider_id();

            if (config_.verbose) {
                std::cout << "[Orchestrator] Switching to fallback provider "
                          << state.provider_id << std::endl;
            }
            if (retry_callback_) {
                retry_callback_(previous, state.attempt, category, 0.0, state.provider_id);
            }
            continue;
        }

        if (!is_retryable(category)) {
            break;
        }

        double delay_ms = compute_backoff_delay_ms(category, state.attempt, config_, jitter_draw());

        if (has_deadline &&
            Clock::now() + std::chrono::milliseconds(static_cast<long long>(delay_ms)) >= deadline) {
            if (config_.verbose) {
                std::cerr << "[Orchestrator] Next retry would pass the deadline" << std::endl;
            }
            break;
        }

        if (retry_callback_) {
            retry_callback_(state.provider_id, state.attempt, category, delay_ms, state.provider_id);
        }

        if (config_.verbose) {
            std::cout << "[Orchestrator] Retrying in " << delay_ms << " ms" << std::endl;
        }

        if (!wait_backoff(delay_ms, cancel)) {
            throw make_cancelled_error(state, "Extraction cancelled during backoff");
        }
    }

    throw make_error(state);
}

void ExtractionOrchestrator::record_deadline(RetryState& state, int timeout_ms) const {
    std::string message = "Deadline of " + std::to_string(timeout_ms) + " ms exceeded";
    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << message << std::endl;
    }

    // A call aborted by the deadline reports Cancelled; surface it as a timeout
    if (!state.last_error || state.last_error->category() == ErrorCategory::Cancelled) {
        state.last_error.emplace(ErrorCategory::Transient, "Network error: " + message, 0,
                                 state.provider_id);
    }
}

bool ExtractionOrchestrator::wait_backoff(double delay_ms, const CancellationToken* cancel) const {
    auto duration = std::chrono::milliseconds(static_cast<long long>(std::ceil(delay_ms)));
    if (cancel) {
        return !cancel->wait_for(duration);
    }
    std::this_thread::sleep_for(duration);
    return true;
}

ExtractionReport ExtractionOrchestrator::build_report(const std::vector<RawCandidate>& candidates,
                                                      const std::string& content,
                                                      const ExtractionOptions& options) const {
    ValidationOptions validation = config_.validation;
    if (options.validation_threshold) {
        validation.min_confidence_threshold = *options.validation_threshold;
    }
    validation.verbose = validation.verbose || config_.verbose;

    BoundaryMatchOptions boundary = config_.boundary;
    boundary.min_confidence_threshold = validation.min_confidence_threshold;
    boundary.verbose = boundary.verbose || config_.verbose;

    BoundaryResolver resolver(boundary, validation);

    ExtractionReport report;
    report.nuggets = resolver.resolve_all(candidates, content);
    report.total_count = static_cast<int>(report.nuggets.size());

    double score_sum = 0.0;
    for (const auto& n : report.nuggets) {
        if (n.is_validated()) {
            report.validated_count++;
        }
        score_sum += n.validation_score;
    }
    if (report.total_count > 0) {
        report.average_validation_score = score_sum / report.total_count;
    }

    return report;
}

ExtractionError ExtractionOrchestrator::make_error(const RetryState& state) const {
    if (!state.last_error) {
        return ExtractionError(ErrorCategory::Unknown, "No provider call was made",
                               user_facing_message(ErrorCategory::Unknown, state.provider_id, ""),
                               state.provider_id, 0, state.attempt);
    }

    const ProviderError& error = *state.last_error;
    return ExtractionError(error.category(), error.what(), user_facing_message(error),
                           error.provider_id(), error.status_code(), state.attempt);
}

ExtractionError ExtractionOrchestrator::make_cancelled_error(const RetryState& state,
                                                             const std::string& reason) const {
    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << reason << std::endl;
    }
    return ExtractionError(ErrorCategory::Cancelled, reason,
                           user_facing_message(ErrorCategory::Cancelled, state.provider_id, reason),
                           state.provider_id, 0, state.attempt);
}

// ============================================================================
// Utility Functions
// ============================================================================

OrchestratorConfig create_default_config() {
    // Use environment for API keys
    return OrchestratorConfig::from_environment();
}

OrchestratorConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    // If specific path provided, try it first
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    // Try .nugget_config.json in multiple locations
    paths_to_try.push_back(".nugget_config.json");
    paths_to_try.push_back("../.nugget_config.json");
    paths_to_try.push_back("../../.nugget_config.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) == 0) {
            try {
                auto config = OrchestratorConfig::from_json_file(path);
                // If config loaded successfully and has API key, use it
                if (!config.llm_api_key.empty()) {
                    return config;
                }
            } catch (const json::exception& e) {
                std::cerr << "[Config] Skipping " << path << ": " << e.what() << std::endl;
            } catch (const std::runtime_error& e) {
                std::cerr << "[Config] Skipping " << path << ": " << e.what() << std::endl;
            }
        }
    }

    // Fallback to environment
    return OrchestratorConfig::from_environment();
}

} // namespace nugget
