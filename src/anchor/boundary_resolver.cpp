#include "anchor/boundary_resolver.hpp"
#include "text/text_normalize.hpp"
#include <algorithm>
#include <iostream>

namespace nugget {

namespace {

ValidationOptions validation_from_boundary(const BoundaryMatchOptions& options) {
    ValidationOptions validation;
    validation.fuzzy_tolerance = options.tolerance;
    validation.min_confidence_threshold = options.min_confidence_threshold;
    validation.verbose = options.verbose;
    return validation;
}

// Longest character fallback slice, in code points
constexpr size_t kMaxCharacterSlice = 50;

} // anonymous namespace

BoundaryResolver::BoundaryResolver(const BoundaryMatchOptions& options)
    : options_(options),
      validator_(validation_from_boundary(options)) {}

BoundaryResolver::BoundaryResolver(const BoundaryMatchOptions& options,
                                   const ValidationOptions& validation)
    : options_(options),
      validator_(validation) {}

// ============================================================================
// Anchor Derivation
// ============================================================================

AnchorPair BoundaryResolver::resolve_anchors(const std::string& full_content,
                                             const std::string& source) const {
    std::string text = trim(full_content);
    if (text.empty()) {
        return AnchorPair();
    }

    // URLs split structurally, strict pattern first
    if (is_url(text, true) || is_url(text, false)) {
        AnchorPair anchors = split_url(text);
        if (validate_boundaries(anchors.start, anchors.end)) {
            return anchors;
        }
        if (options_.verbose) {
            std::cerr << "[BoundaryResolver] URL split produced unusable anchors for: "
                      << text << std::endl;
        }
    }

    AnchorPair anchors = split_words(text, options_.max_start_words, options_.max_end_words);
    if (validate_boundaries(anchors.start, anchors.end)) {
        return anchors;
    }

    anchors = split_halves(text);
    if (validate_boundaries(anchors.start, anchors.end)) {
        return anchors;
    }

    anchors = split_characters(text);
    if (validate_boundaries(anchors.start, anchors.end)) {
        return anchors;
    }

    return single_character_anchors(text, source);
}

AnchorPair BoundaryResolver::split_halves(const std::string& text) const {
    auto spans = word_spans(text);
    if (spans.size() < 2) {
        return AnchorPair();
    }

    size_t half = (spans.size() + 1) / 2;

    AnchorPair anchors;
    anchors.start = text.substr(spans.front().begin, spans[half - 1].end - spans.front().begin);
    anchors.end = text.substr(spans[half].begin, spans.back().end - spans[half].begin);
    return anchors;
}

AnchorPair BoundaryResolver::split_characters(const std::string& text) const {
    size_t length = utf8_length(text);
    if (length < 2) {
        return AnchorPair();
    }

    // Unequal code-point counts guarantee the slices differ
    size_t slice = std::min(kMaxCharacterSlice, length) / 2;

    AnchorPair anchors;
    anchors.start = utf8_prefix(text, slice + 1);
    anchors.end = utf8_suffix(text, slice);
    return anchors;
}

AnchorPair BoundaryResolver::single_character_anchors(const std::string& text,
                                                      const std::string& source) const {
    AnchorPair anchors;
    anchors.end = text;

    size_t pos = source.find(text);
    if (pos != std::string::npos) {
        std::string after = utf8_prefix(source.substr(pos + text.size()), 1);
        if (!after.empty()) {
            anchors.start = text + after;
            return anchors;
        }
        std::string before = utf8_suffix(source.substr(0, pos), 1);
        if (!before.empty()) {
            anchors.start = before + text;
            return anchors;
        }
    }

    // No surrounding context to borrow from
    anchors.start = text + " ";
    return anchors;
}

// ============================================================================
// Resolution
// ============================================================================

ResolvedNugget BoundaryResolver::resolve(const RawCandidate& candidate,
                                         const std::string& source) const {
    ValidationResult validation = validator_.validate(candidate.full_content, source);
    AnchorPair anchors = resolve_anchors(candidate.full_content, source);

    ResolvedNugget nugget;
    nugget.type = candidate.type;
    nugget.full_content = candidate.full_content;
    nugget.start_anchor = anchors.start;
    nugget.end_anchor = anchors.end;
    nugget.confidence = std::min(1.0, std::max(0.0, candidate.confidence));
    nugget.validation_score = validation.score;
    nugget.match_method = validation.match_method;

    if (options_.verbose) {
        std::cout << "[BoundaryResolver] " << nugget_type_to_string(nugget.type)
                  << " score=" << nugget.validation_score
                  << " method=" << match_method_to_string(nugget.match_method)
                  << " start=\"" << nugget.start_anchor << "\""
                  << " end=\"" << nugget.end_anchor << "\"" << std::endl;
    }

    return nugget;
}

std::vector<ResolvedNugget> BoundaryResolver::resolve_all(
    const std::vector<RawCandidate>& candidates,
    const std::string& source
) const {
    std::vector<ResolvedNugget> nuggets;
    nuggets.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        nuggets.push_back(resolve(candidate, source));
    }

    return nuggets;
}

} // namespace nugget
