#include "validation/content_validator.hpp"
#include "text/edit_distance.hpp"
#include "text/text_normalize.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace nugget {

ContentValidator::ContentValidator(const ValidationOptions& options)
    : options_(options) {}

ValidationResult ContentValidator::make_result(double score, MatchMethod tier) const {
    ValidationResult result;
    result.score = score;
    result.tier = tier;
    result.validated = score > 0.0 && score >= options_.min_confidence_threshold;
    result.match_method = result.validated ? tier : MatchMethod::Unverified;
    return result;
}

ValidationResult ContentValidator::validate(const std::string& passage,
                                            const std::string& source) const {
    std::string needle = trim(passage);
    if (needle.empty() || source.empty()) {
        return make_result(0.0, MatchMethod::Unverified);
    }

    // Tier 1: literal
    if (source.find(needle) != std::string::npos) {
        return make_result(kExactScore, MatchMethod::Exact);
    }

    // Tier 2: case, whitespace and typographic variants
    std::string normalized_needle = advanced_normalize(needle);
    std::string normalized_source = advanced_normalize(source);
    if (!normalized_needle.empty() &&
        normalized_source.find(normalized_needle) != std::string::npos) {
        return make_result(kCaseInsensitiveScore, MatchMethod::CaseInsensitive);
    }

    // Tier 3: edit-tolerant search
    if (!normalized_needle.empty() &&
        fuzzy_window_match(normalized_needle, normalized_source)) {
        return make_result(kFuzzyScore, MatchMethod::Fuzzy);
    }

    // Tier 4: long passages whose tail drifted
    if (utf8_length(needle) > options_.partial_prefix_length) {
        std::string prefix = utf8_prefix(needle, options_.partial_prefix_length);
        if (source.find(prefix) != std::string::npos) {
            return make_result(kPartialPrefixScore, MatchMethod::PartialPrefix);
        }
    }

    if (options_.verbose) {
        std::cerr << "[Validator] No match for passage: "
                  << utf8_prefix(needle, 50) << "..." << std::endl;
    }

    return make_result(0.0, MatchMethod::Unverified);
}

bool ContentValidator::fuzzy_window_match(const std::string& passage,
                                          const std::string& source) const {
    const size_t window_size = std::max(2 * passage.size(), options_.min_window_size);
    const size_t stride = std::max<size_t>(1, window_size / 2);

    double tolerance = std::min(1.0, std::max(0.0, options_.fuzzy_tolerance));
    const size_t max_edits = static_cast<size_t>(
        std::floor((1.0 - tolerance) * static_cast<double>(passage.size()))
    );

    const auto passage_words = tokenize_words(passage);

    for (size_t start = 0; start < source.size(); start += stride) {
        std::string window = source.substr(start, window_size);

        if (approximate_substring_distance(passage, window) <= max_edits) {
            if (options_.verbose) {
                std::cout << "[Validator] Fuzzy edit match in window at " << start << std::endl;
            }
            return true;
        }

        if (word_window_match(passage_words, window)) {
            if (options_.verbose) {
                std::cout << "[Validator] Fuzzy word match in window at " << start << std::endl;
            }
            return true;
        }

        if (start + window_size >= source.size()) {
            break;
        }
    }

    return false;
}

bool ContentValidator::word_window_match(const std::vector<std::string>& passage_words,
                                         const std::string& window) const {
    if (passage_words.empty()) return false;

    auto window_words = tokenize_words(window);
    if (window_words.size() < passage_words.size()) return false;

    const size_t n = passage_words.size();
    for (size_t i = 0; i + n <= window_words.size(); ++i) {
        std::vector<std::string> slice(window_words.begin() + i, window_words.begin() + i + n);
        if (word_similarity(passage_words, slice, options_.similarity) >= options_.fuzzy_tolerance) {
            return true;
        }
    }

    return false;
}

} // namespace nugget
