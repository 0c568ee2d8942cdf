#pragma once

#include <string>
#include <vector>

namespace nugget {

/**
 * @brief Scoring weights for word-by-word comparison
 */
struct SimilarityOptions {
    double exact_match_score = 1.0;         ///< Identical words
    double substring_match_score = 0.8;     ///< One word contains the other
    double levenshtein_multiplier = 0.7;    ///< Scales edit similarity
    double levenshtein_threshold = 0.6;     ///< Minimum edit similarity to count
};

/**
 * @brief Multi-tier similarity of two aligned word sequences
 *
 * Each position scores exact_match_score for identical words, else
 * substring_match_score when either word contains the other, else the edit
 * similarity times levenshtein_multiplier when it reaches
 * levenshtein_threshold, else 0. The result is the mean over positions.
 *
 * Sequences of different length score 0.0; two empty sequences score 1.0.
 * Comparison is case-sensitive; callers normalize first when needed.
 */
double word_similarity(const std::vector<std::string>& words1,
                       const std::vector<std::string>& words2,
                       const SimilarityOptions& options = SimilarityOptions());

/**
 * @brief Exact and substring tiers only
 */
double simple_word_similarity(const std::vector<std::string>& words1,
                              const std::vector<std::string>& words2,
                              double substring_score = 0.8);

/**
 * @brief Check whether word_similarity reaches the threshold
 */
bool are_words_similar(const std::vector<std::string>& words1,
                       const std::vector<std::string>& words2,
                       double threshold = 0.7,
                       const SimilarityOptions& options = SimilarityOptions());

/**
 * @brief word_similarity over whitespace-tokenized text
 */
double text_similarity(const std::string& text1,
                       const std::string& text2,
                       const SimilarityOptions& options = SimilarityOptions());

} // namespace nugget
