#pragma once

#include "nugget/nugget.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace nugget {

// ============================================================================
// Consensus Across Extraction Runs
// ============================================================================

/**
 * @brief One group of similar candidates collapsed to a representative
 */
struct ConsensusCandidate {
    RawCandidate candidate;     ///< Member closest to the group centroid
    int supporting_runs = 0;    ///< Distinct runs that produced a member
    int group_size = 0;         ///< Members, duplicates within a run included
    double agreement = 0.0;     ///< supporting_runs / successful runs
    double cohesion = 1.0;      ///< Mean pairwise similarity of the members
};

/**
 * @brief Bag-of-words vectors for a set of passages
 *
 * Passages are normalized and tokenized; each vector counts the words of one
 * passage over the vocabulary of all of them. The vocabulary is ordered by
 * first appearance, so equal inputs give equal vectors.
 */
std::vector<std::vector<float>> term_frequency_vectors(const std::vector<std::string>& passages);

/**
 * @brief Merge the candidates of several runs into consensus candidates
 *
 * Candidates are grouped per nugget type with group_by_similarity over
 * their term-frequency vectors. Each group keeps the member nearest its
 * centroid; its confidence becomes the agreement ratio. Groups supported by
 * fewer than min_supporting_runs runs are dropped. The result is sorted by
 * supporting runs, highest first, ties in order of first appearance.
 *
 * @param runs Candidates of each successful run
 * @param similarity_threshold Cosine similarity needed to join a group
 * @param min_supporting_runs Smallest number of runs a kept group needs
 */
std::vector<ConsensusCandidate> build_consensus(
    const std::vector<std::vector<RawCandidate>>& runs,
    double similarity_threshold = 0.8,
    int min_supporting_runs = 1
);

} // namespace nugget
