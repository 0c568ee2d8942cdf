#pragma once

#include "nugget/nugget.hpp"
#include "text/word_similarity.hpp"
#include <string>
#include <cstddef>

namespace nugget {

// ============================================================================
// Validation Configuration
// ============================================================================

/**
 * @brief Settings for the content validator
 */
struct ValidationOptions {
    double min_confidence_threshold = 0.8;  ///< Score at which a passage counts as validated
    double fuzzy_tolerance = 0.8;           ///< Required match ratio in the fuzzy tier
    size_t min_window_size = 200;           ///< Smallest fuzzy search window (bytes)
    size_t partial_prefix_length = 100;     ///< Prefix length for the partial tier (code points)
    SimilarityOptions similarity;           ///< Word scoring inside fuzzy windows
    bool verbose = false;                   ///< Enable verbose logging
};

/**
 * @brief Outcome of validating one passage
 */
struct ValidationResult {
    double score = 0.0;                         ///< Fixed tier score in [0, 1]
    MatchMethod tier = MatchMethod::Unverified; ///< Tier that produced the score
    MatchMethod match_method = MatchMethod::Unverified; ///< tier if validated, else Unverified
    bool validated = false;                     ///< score >= min_confidence_threshold
};

// ============================================================================
// Content Validator
// ============================================================================

/**
 * @brief Scores whether a claimed passage actually occurs in the source
 *
 * Tiers are tried in order and the first hit wins:
 *  1. exact containment of the trimmed passage            -> 1.0
 *  2. containment after advanced_normalize on both sides  -> 0.95
 *  3. fuzzy search over overlapping windows of the source -> 0.8
 *  4. exact containment of the first 100 code points      -> 0.6
 *  5. nothing                                             -> 0.0
 *
 * Stateless apart from its options; safe to share between threads.
 */
class ContentValidator {
public:
    static constexpr double kExactScore = 1.0;
    static constexpr double kCaseInsensitiveScore = 0.95;
    static constexpr double kFuzzyScore = 0.8;
    static constexpr double kPartialPrefixScore = 0.6;

    explicit ContentValidator(const ValidationOptions& options = ValidationOptions());

    /**
     * @brief Run the tiers and report score and match method
     */
    ValidationResult validate(const std::string& passage, const std::string& source) const;

    /**
     * @brief Score only
     */
    double score(const std::string& passage, const std::string& source) const {
        return validate(passage, source).score;
    }

    const ValidationOptions& get_options() const { return options_; }

private:
    ValidationOptions options_;

    /**
     * @brief Tier 3: edit-distance or word-window hit in any source window
     *
     * Both arguments are already normalized.
     */
    bool fuzzy_window_match(const std::string& passage, const std::string& source) const;

    /**
     * @brief Slide a passage-sized word window over one source window
     */
    bool word_window_match(const std::vector<std::string>& passage_words,
                           const std::string& window) const;

    ValidationResult make_result(double score, MatchMethod tier) const;
};

} // namespace nugget
