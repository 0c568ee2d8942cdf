#pragma once

#include <string>
#include <cstddef>

namespace nugget {

/**
 * @brief Levenshtein edit distance between two strings
 *
 * Counts the single-byte insertions, deletions and substitutions needed to
 * turn one string into the other. O(|a|·|b|) time, O(min(|a|,|b|)) space.
 */
size_t levenshtein_distance(const std::string& a, const std::string& b);

/**
 * @brief Normalized edit similarity in [0, 1]
 *
 * 1 - distance / max(|a|, |b|, 1). Identical strings score 1.0, including
 * two empty strings; a non-empty string against an empty one scores 0.0.
 */
double levenshtein_similarity(const std::string& a, const std::string& b);

/**
 * @brief Check whether two strings reach a similarity threshold
 */
bool is_levenshtein_similar(const std::string& a, const std::string& b,
                            double threshold = 0.8);

/**
 * @brief Smallest edit distance between pattern and any substring of text
 *
 * Same recurrence as levenshtein_distance, but text characters before and
 * after the aligned region are free. Returns |pattern| when text is empty.
 */
size_t approximate_substring_distance(const std::string& pattern,
                                      const std::string& text);

} // namespace nugget
