#pragma once

#include "nugget/nugget.hpp"
#include "text/url_segmenter.hpp"
#include "validation/content_validator.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace nugget {

/**
 * @brief Settings for anchor derivation
 */
struct BoundaryMatchOptions {
    double tolerance = 0.8;                 ///< Fuzzy match ratio passed to the validator
    size_t max_start_words = 5;             ///< Words in the start anchor
    size_t max_end_words = 5;               ///< Words in the end anchor
    double min_confidence_threshold = 0.8;  ///< Validation score needed to count as verified
    bool verbose = false;                   ///< Enable verbose logging
};

/**
 * @brief Turns candidate passages into highlightable nuggets
 *
 * For any non-empty passage the two anchors are non-empty and differ.
 * URLs split at the authority/path boundary, prose takes its first and last
 * words, and degenerate text (repeated single word) falls back to
 * character slices of unequal length.
 */
class BoundaryResolver {
public:
    /**
     * @brief Constructor
     *
     * The validator inherits tolerance and min_confidence_threshold from
     * the boundary options.
     */
    explicit BoundaryResolver(const BoundaryMatchOptions& options = BoundaryMatchOptions());

    /**
     * @brief Constructor with explicit validator settings
     */
    BoundaryResolver(const BoundaryMatchOptions& options,
                     const ValidationOptions& validation);

    /**
     * @brief Derive the anchor pair for one passage
     *
     * @param full_content Passage text
     * @param source Source document, only consulted for a single-character
     *               passage that cannot yield two distinct slices of itself
     */
    AnchorPair resolve_anchors(const std::string& full_content,
                               const std::string& source = "") const;

    /**
     * @brief Validate a candidate and derive its anchors
     *
     * Pure: the same candidate and source always give an identical nugget.
     */
    ResolvedNugget resolve(const RawCandidate& candidate, const std::string& source) const;

    /**
     * @brief Resolve a batch, keeping order and unverified entries
     */
    std::vector<ResolvedNugget> resolve_all(const std::vector<RawCandidate>& candidates,
                                            const std::string& source) const;

    const BoundaryMatchOptions& get_options() const { return options_; }
    const ContentValidator& get_validator() const { return validator_; }

private:
    BoundaryMatchOptions options_;
    ContentValidator validator_;

    AnchorPair split_halves(const std::string& text) const;
    AnchorPair split_characters(const std::string& text) const;
    AnchorPair single_character_anchors(const std::string& text,
                                        const std::string& source) const;
};

} // namespace nugget
