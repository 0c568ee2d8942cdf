#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstddef>

namespace nugget {

/**
 * @brief Raised for malformed vector input
 *
 * These indicate a caller bug (wrong embedding model, corrupted data), not a
 * scoring outcome, so they are exceptions rather than a zero score.
 */
class VectorSimilarityError : public std::invalid_argument {
public:
    enum class Kind {
        DimensionMismatch,   ///< Vectors differ in length
        EmptyVector,         ///< One of the vectors has no components
        InvalidComponent,    ///< A component is NaN or infinite
        BatchSizeMismatch    ///< Batch lists differ in length
    };

    VectorSimilarityError(Kind kind, const std::string& message,
                          size_t component_index = 0,
                          std::optional<size_t> pair_index = std::nullopt)
        : std::invalid_argument(message),
          kind_(kind),
          component_index_(component_index),
          pair_index_(pair_index) {}

    Kind kind() const { return kind_; }

    /// Offending component for InvalidComponent
    size_t component_index() const { return component_index_; }

    /// Offending pair when raised from batch_cosine_similarity
    std::optional<size_t> pair_index() const { return pair_index_; }

private:
    Kind kind_;
    size_t component_index_;
    std::optional<size_t> pair_index_;
};

/**
 * @brief Best candidate returned by find_most_similar
 */
struct SimilarityMatch {
    int index = -1;             ///< Candidate index, -1 when nothing qualified
    double similarity = 0.0;    ///< Cosine similarity of the best candidate
    bool found = false;         ///< Whether any candidate reached the threshold
    size_t skipped = 0;         ///< Malformed candidates ignored during the scan
};

/**
 * @brief Cosine similarity in [-1, 1]
 *
 * Clamped against floating-point drift. A zero-magnitude vector yields 0.
 *
 * @throws VectorSimilarityError on empty input, dimension mismatch or a
 *         non-finite component
 */
double cosine_similarity(const std::vector<float>& u, const std::vector<float>& v);

/**
 * @brief Scale to unit length; the zero vector stays zero
 */
std::vector<float> normalize_vector(const std::vector<float>& v);

/**
 * @brief Pairwise cosine similarity of two equally long lists
 *
 * Stops at the first invalid pair and rethrows with its pair_index set.
 */
std::vector<double> batch_cosine_similarity(
    const std::vector<std::vector<float>>& us,
    const std::vector<std::vector<float>>& vs
);

/**
 * @brief Highest-scoring candidate at or above the threshold
 *
 * Malformed candidates are skipped and counted, never fatal.
 */
SimilarityMatch find_most_similar(
    const std::vector<float>& query,
    const std::vector<std::vector<float>>& candidates,
    double threshold = 0.0
);

/**
 * @brief Greedy single-link grouping of vector indices
 *
 * Scans left to right. Each vector not yet grouped starts a new group and
 * absorbs every later ungrouped vector whose similarity to it (the group
 * representative, not other members) is at least the threshold.
 */
std::vector<std::vector<size_t>> group_by_similarity(
    const std::vector<std::vector<float>>& vectors,
    double threshold = 0.8
);

/**
 * @brief Mean pairwise cosine similarity of a group
 *
 * 1.0 for fewer than two vectors; 0.0 when no pair could be compared.
 */
double group_cohesion(const std::vector<std::vector<float>>& vectors);

} // namespace nugget
