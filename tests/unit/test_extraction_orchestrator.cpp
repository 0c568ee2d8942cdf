#include <gtest/gtest.h>
#include "pipeline/extraction_orchestrator.hpp"
#include <chrono>
#include <deque>
#include <thread>

using namespace nugget;
using json = nlohmann::json;

namespace {

const char* kSource =
    "Most teams treat code review as a gate. "
    "A better mental model is a conversation between two authors. "
    "The Map Is Not The Territory.";

/**
 * @brief Provider that replays a script of failures and answers
 *
 * Each call pops the next step; once the script is exhausted every call
 * repeats the last step.
 */
class ScriptedProvider : public LLMProvider {
public:
    struct Step {
        std::optional<ErrorCategory> error;
        std::vector<RawCandidate> candidates;
        bool plain_exception = false;
        std::string message = "scripted failure";
        int delay_ms = 0;               ///< Time spent before the outcome
        bool honors_cancel = false;     ///< Delay waits on the token like a transfer
    };

    explicit ScriptedProvider(const std::string& id) : id_(id) {
        config_.api_key = "test-key";
    }

    ScriptedProvider& fail(ErrorCategory category, const std::string& message = "scripted failure") {
        Step step;
        step.error = category;
        step.message = message;
        steps_.push_back(step);
        return *this;
    }

    ScriptedProvider& throw_plain(const std::string& message) {
        Step step;
        step.plain_exception = true;
        step.message = message;
        steps_.push_back(step);
        return *this;
    }

    // Slow call that never looks at the token
    ScriptedProvider& fail_after(int delay_ms, ErrorCategory category) {
        Step step;
        step.error = category;
        step.delay_ms = delay_ms;
        steps_.push_back(step);
        return *this;
    }

    // Hung transfer that only ends when the token fires
    ScriptedProvider& stall(int delay_ms) {
        Step step;
        step.delay_ms = delay_ms;
        step.honors_cancel = true;
        steps_.push_back(step);
        return *this;
    }

    ScriptedProvider& answer(const std::vector<RawCandidate>& candidates) {
        Step step;
        step.candidates = candidates;
        steps_.push_back(step);
        return *this;
    }

    std::vector<RawCandidate> extract(
        const std::string& content,
        const std::string& prompt,
        std::optional<double> temperature,
        const std::vector<NuggetType>& types,
        const CancellationToken* cancel
    ) override {
        ++calls;
        last_content = content;
        last_prompt = prompt;
        last_temperature = temperature;
        last_types = types;

        if (steps_.empty()) {
            return {};
        }
        Step step = steps_.front();
        if (steps_.size() > 1) {
            steps_.pop_front();
        }

        if (step.delay_ms > 0) {
            auto delay = std::chrono::milliseconds(step.delay_ms);
            if (step.honors_cancel && cancel) {
                if (cancel->wait_for(delay)) {
                    throw ProviderError(ErrorCategory::Cancelled, "Request cancelled", 0, id_);
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }

        if (step.plain_exception) {
            throw std::runtime_error(step.message);
        }
        if (step.error) {
            throw ProviderError(*step.error, step.message, 0, id_);
        }
        return step.candidates;
    }

    std::string provider_id() const override { return id_; }
    std::string get_model() const override { return "scripted"; }
    bool is_configured() const override { return true; }
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }

    int calls = 0;
    std::string last_content;
    std::string last_prompt;
    std::optional<double> last_temperature;
    std::vector<NuggetType> last_types;

private:
    std::string id_;
    std::deque<Step> steps_;
};

struct RetryEvent {
    std::string provider_id;
    int attempt;
    ErrorCategory category;
    double delay_ms;
    std::string next_provider_id;
};

} // namespace

// ==========================================
// Test Fixture
// ==========================================

class ExtractionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.base_delay_ms = 1.0;
        config.max_delay_ms = 4.0;
        config.jitter_fraction = 0.0;
        config.enable_cache = false;
        config.fallback_after_failures = 10;
    }

    ScriptedProvider* add_provider(const std::string& id) {
        auto provider = std::make_unique<ScriptedProvider>(id);
        ScriptedProvider* raw = provider.get();
        providers.push_back(std::move(provider));
        return raw;
    }

    std::unique_ptr<ExtractionOrchestrator> build() {
        auto orchestrator = std::make_unique<ExtractionOrchestrator>(std::move(providers), config);
        orchestrator->set_retry_callback([this](const std::string& provider_id, int attempt,
                                                ErrorCategory category, double delay_ms,
                                                const std::string& next_provider_id) {
            events.push_back({provider_id, attempt, category, delay_ms, next_provider_id});
        });
        return orchestrator;
    }

    static ExtractionError capture_failure(ExtractionOrchestrator& orchestrator,
                                           const ExtractionOptions& options = ExtractionOptions(),
                                           const CancellationToken* cancel = nullptr) {
        try {
            orchestrator.extract_validated(kSource, "", options, cancel);
        } catch (const ExtractionError& e) {
            return e;
        }
        ADD_FAILURE() << "Expected ExtractionError";
        return ExtractionError(ErrorCategory::Unknown, "not thrown", "", "", 0, 0);
    }

    static RawCandidate model_candidate() {
        return {NuggetType::Model, "A better mental model is a conversation between two authors.", 0.9};
    }

    OrchestratorConfig config;
    std::vector<std::unique_ptr<LLMProvider>> providers;
    std::vector<RetryEvent> events;
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, RequiresAtLeastOneProvider) {
    EXPECT_THROW(ExtractionOrchestrator(std::move(providers), config), std::invalid_argument);
}

TEST_F(ExtractionOrchestratorTest, RejectsNullProvider) {
    providers.push_back(nullptr);
    EXPECT_THROW(ExtractionOrchestrator(std::move(providers), config), std::invalid_argument);
}

TEST_F(ExtractionOrchestratorTest, ProviderIdsInOrder) {
    add_provider("gemini");
    add_provider("openai");
    auto orchestrator = build();
    EXPECT_EQ(orchestrator->provider_ids(), (std::vector<std::string>{"gemini", "openai"}));
}

// ==========================================
// Success Path Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, FirstCallSucceeds) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(report.provider_id, "gemini");
    EXPECT_FALSE(report.from_cache);
    ASSERT_EQ(report.total_count, 1);
    EXPECT_EQ(report.validated_count, 1);
    EXPECT_EQ(report.nuggets[0].match_method, MatchMethod::Exact);
    EXPECT_EQ(report.nuggets[0].start_anchor, "A better mental model is");
    EXPECT_TRUE(events.empty());
}

TEST_F(ExtractionOrchestratorTest, EmptyPromptUsesDefault) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();

    orchestrator->extract_validated(kSource);
    EXPECT_EQ(primary->last_prompt, PromptTemplates::default_extraction_prompt());

    orchestrator->extract_validated(kSource, "Only tools please");
    EXPECT_EQ(primary->last_prompt, "Only tools please");
}

TEST_F(ExtractionOrchestratorTest, PassesTemperatureAndTypes) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();

    ExtractionOptions options;
    options.temperature = 0.1;
    options.selected_types = {NuggetType::Tool};
    orchestrator->extract_validated(kSource, "", options);

    ASSERT_TRUE(primary->last_temperature.has_value());
    EXPECT_DOUBLE_EQ(*primary->last_temperature, 0.1);
    EXPECT_EQ(primary->last_types, options.selected_types);
}

TEST_F(ExtractionOrchestratorTest, FiltersCandidatesBySelectedTypes) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({
        model_candidate(),
        {NuggetType::Tool, "Most teams treat code review as a gate.", 0.6}
    });
    auto orchestrator = build();

    ExtractionOptions options;
    options.selected_types = {NuggetType::Tool};
    ExtractionReport report = orchestrator->extract_validated(kSource, "", options);

    ASSERT_EQ(report.total_count, 1);
    EXPECT_EQ(report.nuggets[0].type, NuggetType::Tool);
}

TEST_F(ExtractionOrchestratorTest, ReportAveragesOverAllNuggets) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({
        model_candidate(),
        {NuggetType::Explanation, "Completely unrelated sentence about gardening tools.", 0.4}
    });
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(report.total_count, 2);
    EXPECT_EQ(report.validated_count, 1);
    EXPECT_DOUBLE_EQ(report.average_validation_score, 0.5);
    EXPECT_EQ(report.nuggets[1].match_method, MatchMethod::Unverified);

    auto j = report.to_json();
    EXPECT_EQ(j["golden_nuggets"].size(), 2u);
    EXPECT_EQ(j["provider_id"].get<std::string>(), "gemini");
}

TEST_F(ExtractionOrchestratorTest, EmptyAnswerGivesEmptyReport) {
    add_provider("gemini")->answer({});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);
    EXPECT_EQ(report.total_count, 0);
    EXPECT_DOUBLE_EQ(report.average_validation_score, 0.0);
}

TEST_F(ExtractionOrchestratorTest, ThresholdOverrideApplies) {
    RawCandidate lowered{NuggetType::Model, "the map is not the territory.", 0.8};
    add_provider("gemini")->answer({lowered});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);
    EXPECT_EQ(report.nuggets[0].match_method, MatchMethod::CaseInsensitive);
    EXPECT_DOUBLE_EQ(report.nuggets[0].validation_score, 0.95);

    ExtractionOptions strict;
    strict.validation_threshold = 1.0;
    report = orchestrator->extract_validated(kSource, "", strict);
    EXPECT_EQ(report.nuggets[0].match_method, MatchMethod::Unverified);
    EXPECT_DOUBLE_EQ(report.nuggets[0].validation_score, 0.95);
    EXPECT_EQ(report.validated_count, 0);
}

TEST_F(ExtractionOrchestratorTest, RejectsOutOfRangeOptions) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionOptions options;
    options.validation_threshold = 0.0;
    EXPECT_THROW(orchestrator->extract_validated(kSource, "", options), std::invalid_argument);

    options.validation_threshold = 1.5;
    EXPECT_THROW(orchestrator->extract_validated(kSource, "", options), std::invalid_argument);

    options.validation_threshold = 1.0;
    options.timeout_ms = -1;
    EXPECT_THROW(orchestrator->extract_validated(kSource, "", options), std::invalid_argument);
    EXPECT_EQ(primary->calls, 0);

    options.timeout_ms = 0;
    ExtractionReport report = orchestrator->extract_validated(kSource, "", options);
    EXPECT_EQ(report.validated_count, 1);
}

TEST_F(ExtractionOrchestratorTest, LongContentTruncatedForProviderOnly) {
    config.max_content_length = 45;
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({{NuggetType::Analogy, "The Map Is Not The Territory.", 0.7}});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->last_content, "Most teams treat code review as a gate.");
    EXPECT_EQ(report.nuggets[0].match_method, MatchMethod::Exact);
}

// ==========================================
// Retry Policy Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, StructuralErrorIsNotRetried) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Structural, "Malformed response");
    ScriptedProvider* fallback = add_provider("openai");
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);

    EXPECT_EQ(error.category(), ErrorCategory::Structural);
    EXPECT_EQ(error.attempts(), 1);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(fallback->calls, 0);
}

TEST_F(ExtractionOrchestratorTest, AuthErrorFailsImmediately) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::AuthConfig, "Invalid API key");
    add_provider("openai");
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);

    EXPECT_EQ(error.category(), ErrorCategory::AuthConfig);
    EXPECT_EQ(error.provider_id(), "gemini");
    EXPECT_EQ(primary->calls, 1);
    EXPECT_NE(error.user_message().find("API key"), std::string::npos);
}

TEST_F(ExtractionOrchestratorTest, TransientErrorsRetryInPlace) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient).fail(ErrorCategory::Transient).answer({model_candidate()});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->calls, 3);
    EXPECT_EQ(report.attempts, 3);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].next_provider_id, "gemini");
    EXPECT_DOUBLE_EQ(events[0].delay_ms, 1.0);
    EXPECT_DOUBLE_EQ(events[1].delay_ms, 2.0);
}

TEST_F(ExtractionOrchestratorTest, ExhaustionSurfacesLastError) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient)
            .fail(ErrorCategory::RateLimit)
            .fail(ErrorCategory::ServerError, "HTTP 500: Internal error");
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);

    EXPECT_EQ(error.category(), ErrorCategory::ServerError);
    EXPECT_EQ(error.attempts(), 3);
    EXPECT_EQ(primary->calls, 3);
    EXPECT_STREQ(error.what(), "HTTP 500: Internal error");
}

TEST_F(ExtractionOrchestratorTest, MaxAttemptsBoundsCalls) {
    config.max_attempts = 1;
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient);
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);
    EXPECT_EQ(error.category(), ErrorCategory::Transient);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_TRUE(events.empty());
}

TEST_F(ExtractionOrchestratorTest, ModelUnavailableWithoutFallbackStops) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::ModelUnavailable, "model not found");
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);
    EXPECT_EQ(error.category(), ErrorCategory::ModelUnavailable);
    EXPECT_EQ(primary->calls, 1);
}

TEST_F(ExtractionOrchestratorTest, PlainExceptionIsClassified) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->throw_plain("connection timed out").answer({model_candidate()});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);
    EXPECT_EQ(report.attempts, 2);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].category, ErrorCategory::Transient);
}

// ==========================================
// Fallback Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, ServerErrorSwitchesProvider) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::ServerError);
    ScriptedProvider* fallback = add_provider("openai");
    fallback->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(fallback->calls, 1);
    EXPECT_EQ(report.provider_id, "openai");
    EXPECT_EQ(report.attempts, 2);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].provider_id, "gemini");
    EXPECT_EQ(events[0].next_provider_id, "openai");
    EXPECT_DOUBLE_EQ(events[0].delay_ms, 0.0);
}

TEST_F(ExtractionOrchestratorTest, RepeatedFailuresSwitchProvider) {
    config.fallback_after_failures = 2;
    config.max_attempts = 4;
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient);
    ScriptedProvider* fallback = add_provider("openai");
    fallback->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionReport report = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->calls, 2);
    EXPECT_EQ(fallback->calls, 1);
    EXPECT_EQ(report.attempts, 3);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].next_provider_id, "gemini");
    EXPECT_EQ(events[1].next_provider_id, "openai");
}

TEST_F(ExtractionOrchestratorTest, AttemptsSharedAcrossProviders) {
    config.max_attempts = 2;
    add_provider("gemini")->fail(ErrorCategory::ServerError);
    add_provider("openai")->fail(ErrorCategory::RateLimit, "Too many requests");
    auto orchestrator = build();

    ExtractionError error = capture_failure(*orchestrator);
    EXPECT_EQ(error.category(), ErrorCategory::RateLimit);
    EXPECT_EQ(error.provider_id(), "openai");
    EXPECT_EQ(error.attempts(), 2);
}

// ==========================================
// Backoff Tests
// ==========================================

TEST(BackoffDelayTest, DoublesUpToCap) {
    OrchestratorConfig config;
    config.base_delay_ms = 100.0;
    config.max_delay_ms = 350.0;
    config.jitter_fraction = 0.0;

    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::Transient, 1, config, 0.5), 100.0);
    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::Transient, 2, config, 0.5), 200.0);
    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::Transient, 3, config, 0.5), 350.0);
}

TEST(BackoffDelayTest, RateLimitWaitsLonger) {
    OrchestratorConfig config;
    config.jitter_fraction = 0.0;

    double transient = ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::Transient, 1, config, 0.0);
    double rate_limit = ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::RateLimit, 1, config, 0.0);
    EXPECT_GT(rate_limit, transient);
    EXPECT_DOUBLE_EQ(rate_limit, transient * config.rate_limit_multiplier);

    // The cap scales too
    double capped = ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::RateLimit, 20, config, 0.0);
    EXPECT_DOUBLE_EQ(capped, config.max_delay_ms * config.rate_limit_multiplier);
}

TEST(BackoffDelayTest, JitterStaysWithinFraction) {
    OrchestratorConfig config;
    config.base_delay_ms = 1000.0;
    config.jitter_fraction = 0.1;

    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::ServerError, 1, config, 0.0), 1000.0);
    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::ServerError, 1, config, 1.0), 1100.0);
    EXPECT_DOUBLE_EQ(ExtractionOrchestrator::compute_backoff_delay_ms(ErrorCategory::ServerError, 1, config, 7.0), 1100.0);
}

TEST(BackoffDelayTest, RateLimitOutlastsJitteredTransient) {
    OrchestratorConfig config;
    config.llm_api_key = "key";
    config.rate_limit_multiplier = 1.15;
    config.jitter_fraction = 0.1;
    std::string error;
    ASSERT_TRUE(config.validate(error)) << error;

    for (int attempt = 1; attempt <= 20; ++attempt) {
        double slowest_transient = ExtractionOrchestrator::compute_backoff_delay_ms(
            ErrorCategory::Transient, attempt, config, 1.0);
        double fastest_rate_limit = ExtractionOrchestrator::compute_backoff_delay_ms(
            ErrorCategory::RateLimit, attempt, config, 0.0);
        EXPECT_GT(fastest_rate_limit, slowest_transient) << "attempt " << attempt;
    }
}

// ==========================================
// Cancellation and Deadline Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, CancelledBeforeFirstCall) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();

    CancellationToken token;
    token.cancel();
    ExtractionError error = capture_failure(*orchestrator, ExtractionOptions(), &token);

    EXPECT_EQ(error.category(), ErrorCategory::Cancelled);
    EXPECT_EQ(primary->calls, 0);
}

TEST_F(ExtractionOrchestratorTest, CancelInterruptsBackoff) {
    config.base_delay_ms = 10000.0;
    config.max_delay_ms = 10000.0;
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient);
    auto orchestrator = build();

    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    ExtractionError error = capture_failure(*orchestrator, ExtractionOptions(), &token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(error.category(), ErrorCategory::Cancelled);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ExtractionOrchestratorTest, DeadlineStopsRetries) {
    config.base_delay_ms = 10000.0;
    config.max_delay_ms = 10000.0;
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Transient, "Network error: timed out");
    auto orchestrator = build();

    ExtractionOptions options;
    options.timeout_ms = 100;
    ExtractionError error = capture_failure(*orchestrator, options);

    EXPECT_EQ(error.category(), ErrorCategory::Transient);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_TRUE(events.empty());
}

TEST_F(ExtractionOrchestratorTest, DeadlinePassedDuringCallSkipsFallback) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail_after(300, ErrorCategory::ServerError);
    ScriptedProvider* fallback = add_provider("openai");
    fallback->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionOptions options;
    options.timeout_ms = 100;
    ExtractionError error = capture_failure(*orchestrator, options);

    EXPECT_EQ(error.category(), ErrorCategory::ServerError);
    EXPECT_EQ(error.provider_id(), "gemini");
    EXPECT_EQ(error.attempts(), 1);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(fallback->calls, 0);
    EXPECT_TRUE(events.empty());
}

TEST_F(ExtractionOrchestratorTest, DeadlineAbortsHungCall) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->stall(10000);
    ScriptedProvider* fallback = add_provider("openai");
    fallback->answer({model_candidate()});
    auto orchestrator = build();

    ExtractionOptions options;
    options.timeout_ms = 100;

    auto start = std::chrono::steady_clock::now();
    ExtractionError error = capture_failure(*orchestrator, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(error.category(), ErrorCategory::Transient);
    EXPECT_NE(std::string(error.what()).find("Deadline of 100 ms exceeded"), std::string::npos);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(fallback->calls, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ExtractionOrchestratorTest, CancelReachesCallUnderDeadline) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->stall(10000);
    auto orchestrator = build();

    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    ExtractionOptions options;
    options.timeout_ms = 60000;

    auto start = std::chrono::steady_clock::now();
    ExtractionError error = capture_failure(*orchestrator, options, &token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(error.category(), ErrorCategory::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(CancellationTokenTest, DeadlineCancelsLinkedToken) {
    auto deadline = CancellationToken::Clock::now() + std::chrono::milliseconds(30);
    CancellationToken token(nullptr, deadline);

    EXPECT_FALSE(token.is_cancelled());
    ASSERT_TRUE(token.remaining().has_value());
    EXPECT_LE(*token.remaining(), std::chrono::milliseconds(30));

    EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_TRUE(token.deadline_passed());
    EXPECT_EQ(*token.remaining(), std::chrono::milliseconds(0));
}

TEST(CancellationTokenTest, ParentCancelReachesLinkedToken) {
    CancellationToken parent;
    CancellationToken child(&parent, CancellationToken::Clock::now() + std::chrono::hours(1));
    EXPECT_FALSE(child.is_cancelled());
    EXPECT_FALSE(child.wait_for(std::chrono::milliseconds(5)));

    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(child.deadline_passed());
    EXPECT_FALSE(CancellationToken().remaining().has_value());
}

// ==========================================
// Ensemble Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, EnsembleKeepsWhatRunsAgreeOn) {
    RawCandidate gate{NuggetType::Explanation, "Most teams treat code review as a gate.", 0.6};
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({model_candidate(), gate})
            .answer({model_candidate()})
            .fail(ErrorCategory::Structural);
    auto orchestrator = build();

    EnsembleReport report = orchestrator->extract_ensemble(kSource);

    EXPECT_EQ(primary->calls, 3);
    EXPECT_EQ(report.total_runs, 3);
    EXPECT_EQ(report.successful_runs, 2);
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(report.candidate_count, 3);
    EXPECT_EQ(report.duplicates_removed, 1);

    ASSERT_EQ(report.nuggets.size(), 2u);
    EXPECT_EQ(report.nuggets[0].nugget.full_content, model_candidate().full_content);
    EXPECT_EQ(report.nuggets[0].supporting_runs, 2);
    EXPECT_DOUBLE_EQ(report.nuggets[0].nugget.confidence, 1.0);
    EXPECT_EQ(report.nuggets[0].nugget.match_method, MatchMethod::Exact);
    EXPECT_FALSE(report.nuggets[0].nugget.start_anchor.empty());

    EXPECT_EQ(report.nuggets[1].nugget.full_content, gate.full_content);
    EXPECT_DOUBLE_EQ(report.nuggets[1].nugget.confidence, 0.5);
    EXPECT_EQ(report.validated_count, 2);
    EXPECT_DOUBLE_EQ(report.average_validation_score, 1.0);

    json j = report.to_json();
    EXPECT_EQ(j["golden_nuggets"].size(), 2u);
    EXPECT_EQ(j["golden_nuggets"][0]["supportingRuns"].get<int>(), 2);
    EXPECT_EQ(j["successful_runs"].get<int>(), 2);
}

TEST_F(ExtractionOrchestratorTest, EnsembleUsesOwnDefaultTemperature) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();

    EnsembleOptions ensemble;
    ensemble.runs = 1;
    ensemble.default_temperature = 0.9;
    orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), ensemble);
    ASSERT_TRUE(primary->last_temperature.has_value());
    EXPECT_DOUBLE_EQ(*primary->last_temperature, 0.9);

    ExtractionOptions options;
    options.temperature = 0.2;
    orchestrator->extract_ensemble(kSource, "", options, ensemble);
    EXPECT_DOUBLE_EQ(*primary->last_temperature, 0.2);
}

TEST_F(ExtractionOrchestratorTest, EnsembleBypassesCache) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({model_candidate()});
    auto orchestrator = build();
    orchestrator->set_cache(std::make_shared<ResponseCache>());

    EnsembleOptions ensemble;
    ensemble.runs = 2;
    EnsembleReport report = orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), ensemble);

    EXPECT_EQ(primary->calls, 2);
    EXPECT_EQ(report.nuggets.size(), 1u);
    EXPECT_EQ(orchestrator->get_cache()->size(), 0u);
}

TEST_F(ExtractionOrchestratorTest, EnsembleFailsWhenEveryRunFails) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::AuthConfig, "HTTP 401: invalid api key");
    auto orchestrator = build();

    try {
        orchestrator->extract_ensemble(kSource);
        FAIL() << "Expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::AuthConfig);
        EXPECT_EQ(e.provider_id(), "gemini");
    }
    EXPECT_EQ(primary->calls, 3);
}

TEST_F(ExtractionOrchestratorTest, EnsembleStopsOnCancel) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();

    CancellationToken token;
    token.cancel();
    try {
        orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), EnsembleOptions(), &token);
        FAIL() << "Expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Cancelled);
    }
    EXPECT_EQ(primary->calls, 0);
}

TEST_F(ExtractionOrchestratorTest, EnsembleDeadlineCoversAllRuns) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->stall(10000);
    auto orchestrator = build();

    ExtractionOptions options;
    options.timeout_ms = 100;

    auto start = std::chrono::steady_clock::now();
    try {
        orchestrator->extract_ensemble(kSource, "", options);
        FAIL() << "Expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Transient);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(primary->calls, 1);
}

TEST_F(ExtractionOrchestratorTest, EnsembleRejectsBadOptions) {
    add_provider("gemini");
    auto orchestrator = build();

    EnsembleOptions ensemble;
    ensemble.runs = 0;
    EXPECT_THROW(orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), ensemble),
                 std::invalid_argument);

    ensemble = EnsembleOptions();
    ensemble.similarity_threshold = 0.0;
    EXPECT_THROW(orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), ensemble),
                 std::invalid_argument);

    ensemble = EnsembleOptions();
    ensemble.min_supporting_runs = 4;
    EXPECT_THROW(orchestrator->extract_ensemble(kSource, "", ExtractionOptions(), ensemble),
                 std::invalid_argument);
}

// ==========================================
// Cache Tests
// ==========================================

TEST_F(ExtractionOrchestratorTest, CacheHitSkipsProvider) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->answer({model_candidate()});
    auto orchestrator = build();
    orchestrator->set_cache(std::make_shared<ResponseCache>());

    ExtractionReport first = orchestrator->extract_validated(kSource);
    ExtractionReport second = orchestrator->extract_validated(kSource);

    EXPECT_EQ(primary->calls, 1);
    EXPECT_FALSE(first.from_cache);
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(second.attempts, 0);
    EXPECT_EQ(second.nuggets, first.nuggets);
}

TEST_F(ExtractionOrchestratorTest, CacheKeyedByPrompt) {
    ScriptedProvider* primary = add_provider("gemini");
    auto orchestrator = build();
    orchestrator->set_cache(std::make_shared<ResponseCache>());

    orchestrator->extract_validated(kSource, "prompt one");
    orchestrator->extract_validated(kSource, "prompt two");
    EXPECT_EQ(primary->calls, 2);
}

TEST_F(ExtractionOrchestratorTest, FailuresAreNotCached) {
    ScriptedProvider* primary = add_provider("gemini");
    primary->fail(ErrorCategory::Structural).answer({model_candidate()});
    auto orchestrator = build();
    orchestrator->set_cache(std::make_shared<ResponseCache>());

    capture_failure(*orchestrator);
    ExtractionReport report = orchestrator->extract_validated(kSource);
    EXPECT_FALSE(report.from_cache);
    EXPECT_EQ(primary->calls, 2);
}

TEST_F(ExtractionOrchestratorTest, CacheEnabledFromConfig) {
    config.enable_cache = true;
    add_provider("gemini");
    auto orchestrator = build();
    ASSERT_NE(orchestrator->get_cache(), nullptr);
    EXPECT_EQ(orchestrator->get_cache()->capacity(), config.cache_capacity);

    orchestrator->set_cache(nullptr);
    EXPECT_EQ(orchestrator->get_cache(), nullptr);
}
