#include <gtest/gtest.h>
#include "validation/content_validator.hpp"
#include "text/text_normalize.hpp"
#include <algorithm>
#include <cctype>
#include <random>

using namespace nugget;

class ContentValidatorTest : public ::testing::Test {
protected:
    ContentValidator validator;

    const std::string source =
        "Most teams treat code review as a gate. A better mental model is a conversation: "
        "the reviewer is a second author who happens to arrive late. "
        "\xE2\x80\x9CIt\xE2\x80\x99s cheaper to fix a design in review than in production,\xE2\x80\x9D "
        "as one engineer put it.";
};

// ==========================================
// Tier Tests
// ==========================================

TEST_F(ContentValidatorTest, ExactMatch) {
    auto result = validator.validate("A better mental model is a conversation", source);
    EXPECT_DOUBLE_EQ(result.score, ContentValidator::kExactScore);
    EXPECT_EQ(result.tier, MatchMethod::Exact);
    EXPECT_EQ(result.match_method, MatchMethod::Exact);
    EXPECT_TRUE(result.validated);
}

TEST_F(ContentValidatorTest, ExactMatchIgnoresSurroundingWhitespace) {
    auto result = validator.validate("  \n the reviewer is a second author  ", source);
    EXPECT_EQ(result.tier, MatchMethod::Exact);
}

TEST_F(ContentValidatorTest, CaseAndWhitespaceVariant) {
    auto result = validator.validate("A BETTER mental   model\nis a conversation", source);
    EXPECT_DOUBLE_EQ(result.score, ContentValidator::kCaseInsensitiveScore);
    EXPECT_EQ(result.match_method, MatchMethod::CaseInsensitive);
    EXPECT_TRUE(result.validated);
}

TEST_F(ContentValidatorTest, TypographicQuoteVariant) {
    auto result = validator.validate("\"It's cheaper to fix a design in review", source);
    EXPECT_EQ(result.match_method, MatchMethod::CaseInsensitive);
}

TEST_F(ContentValidatorTest, FuzzyMatchWithTypo) {
    auto result = validator.validate(
        "the reviewer is a second auther who happens to arive late", source);
    EXPECT_DOUBLE_EQ(result.score, ContentValidator::kFuzzyScore);
    EXPECT_EQ(result.match_method, MatchMethod::Fuzzy);
    EXPECT_TRUE(result.validated);
}

TEST_F(ContentValidatorTest, ExactToleranceDisablesFuzzyTier) {
    ValidationOptions options;
    options.fuzzy_tolerance = 1.0;
    ContentValidator strict(options);

    auto result = strict.validate(
        "the reviewer is a second auther who happens to arive late", source);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_EQ(result.match_method, MatchMethod::Unverified);
}

TEST_F(ContentValidatorTest, PartialPrefixMatch) {
    const std::string opening =
        "Spaced repetition works because each review happens just before you would forget, "
        "which strengthens the memory trace";
    const std::string short_source = opening + ". That is the whole idea.";
    const std::string passage = opening +
        " and then the model went on to invent an ending that appears nowhere in the text, "
        "with plenty of extra words so it cannot pass as a typo";

    auto result = validator.validate(passage, short_source);
    EXPECT_DOUBLE_EQ(result.score, ContentValidator::kPartialPrefixScore);
    EXPECT_EQ(result.tier, MatchMethod::PartialPrefix);

    // 0.6 is below the default threshold of 0.8
    EXPECT_FALSE(result.validated);
    EXPECT_EQ(result.match_method, MatchMethod::Unverified);

    ValidationOptions lenient;
    lenient.min_confidence_threshold = 0.5;
    auto lenient_result = ContentValidator(lenient).validate(passage, short_source);
    EXPECT_TRUE(lenient_result.validated);
    EXPECT_EQ(lenient_result.match_method, MatchMethod::PartialPrefix);
}

TEST_F(ContentValidatorTest, NoMatch) {
    auto result = validator.validate("Quantum chromodynamics explains the strong force.", source);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_EQ(result.tier, MatchMethod::Unverified);
    EXPECT_FALSE(result.validated);
}

// ==========================================
// Edge Case Tests
// ==========================================

TEST_F(ContentValidatorTest, EmptyInputsScoreZero) {
    EXPECT_DOUBLE_EQ(validator.score("", source), 0.0);
    EXPECT_DOUBLE_EQ(validator.score("   ", source), 0.0);
    EXPECT_DOUBLE_EQ(validator.score("anything", ""), 0.0);
}

TEST_F(ContentValidatorTest, ThresholdOfOneAcceptsOnlyExact) {
    ValidationOptions options;
    options.min_confidence_threshold = 1.0;
    ContentValidator exact_only(options);

    EXPECT_TRUE(exact_only.validate("second author", source).validated);
    EXPECT_FALSE(exact_only.validate("SECOND AUTHOR", source).validated);
}

TEST_F(ContentValidatorTest, ScoreIsDeterministic) {
    std::string passage = "the reviewer is a second auther";
    EXPECT_DOUBLE_EQ(validator.score(passage, source), validator.score(passage, source));
}

TEST_F(ContentValidatorTest, FuzzyMatchFarIntoLongSource) {
    std::string long_source;
    for (int i = 0; i < 40; ++i) {
        long_source += "Filler sentence number " + std::to_string(i) + " talks about nothing. ";
    }
    long_source += "Batch your small decisions so that willpower is saved for the big ones.";

    auto result = validator.validate(
        "Batch your smal decisions so that willpower is saved for the big ones", long_source);
    EXPECT_EQ(result.match_method, MatchMethod::Fuzzy);
}

// ==========================================
// Generated Passage Tests
// ==========================================

namespace {

// Word-aligned slice of the source, then one random edit
std::string generate_passage(const std::string& source, std::mt19937& rng) {
    static const std::vector<std::string> kForeign = {
        "deployment", "caf\xC3\xA9", "\xE6\x97\xA5\xE6\x9C\xAC", "gate.", "the", "zz"
    };

    auto spans = word_spans(source);
    std::uniform_int_distribution<size_t> pick_start(0, spans.size() - 1);
    size_t first = pick_start(rng);
    std::uniform_int_distribution<size_t> pick_count(1, std::min<size_t>(12, spans.size() - first));
    size_t last = first + pick_count(rng) - 1;
    std::string passage = source.substr(spans[first].begin, spans[last].end - spans[first].begin);

    switch (std::uniform_int_distribution<int>(0, 4)(rng)) {
        case 0:
            break;
        case 1:
            for (auto& c : passage) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            break;
        case 2: {
            std::uniform_int_distribution<size_t> pos(0, passage.size() - 1);
            size_t i = pos(rng);
            if (static_cast<unsigned char>(passage[i]) < 0x80) passage[i] = 'q';
            break;
        }
        case 3: {
            std::uniform_int_distribution<size_t> word(0, kForeign.size() - 1);
            passage += " " + kForeign[word(rng)];
            break;
        }
        default: {
            std::uniform_int_distribution<size_t> word(0, kForeign.size() - 1);
            passage.clear();
            for (int i = 0; i < 4; ++i) passage += kForeign[word(rng)] + " ";
            break;
        }
    }
    return passage;
}

} // namespace

TEST_F(ContentValidatorTest, ThresholdDecidesMatchMethodForGeneratedPassages) {
    const std::vector<double> thresholds = {0.05, 0.5, 0.6, 0.8, 0.95, 1.0};
    std::mt19937 rng(20240611);

    for (int i = 0; i < 300; ++i) {
        std::string passage = generate_passage(source, rng);

        for (double threshold : thresholds) {
            ValidationOptions options;
            options.min_confidence_threshold = threshold;
            ValidationResult result = ContentValidator(options).validate(passage, source);

            bool verified = result.match_method != MatchMethod::Unverified;
            EXPECT_EQ(result.score >= threshold, verified)
                << "passage: " << passage << ", threshold " << threshold;
            EXPECT_EQ(result.validated, verified) << passage;
            EXPECT_EQ(result.score == 0.0, result.tier == MatchMethod::Unverified) << passage;
            if (verified) {
                EXPECT_EQ(result.match_method, result.tier) << passage;
            }
        }
    }
}
