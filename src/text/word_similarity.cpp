#include "text/word_similarity.hpp"
#include "text/edit_distance.hpp"
#include "text/text_normalize.hpp"

namespace nugget {

double word_similarity(const std::vector<std::string>& words1,
                       const std::vector<std::string>& words2,
                       const SimilarityOptions& options) {
    if (words1.size() != words2.size()) {
        return 0.0;
    }
    if (words1.empty()) {
        return 1.0;
    }

    double total = 0.0;

    for (size_t i = 0; i < words1.size(); ++i) {
        const std::string& a = words1[i];
        const std::string& b = words2[i];

        if (a == b) {
            total += options.exact_match_score;
        } else if (a.find(b) != std::string::npos || b.find(a) != std::string::npos) {
            total += options.substring_match_score;
        } else {
            double similarity = levenshtein_similarity(a, b);
            if (similarity >= options.levenshtein_threshold) {
                total += similarity * options.levenshtein_multiplier;
            }
        }
    }

    return total / static_cast<double>(words1.size());
}

double simple_word_similarity(const std::vector<std::string>& words1,
                              const std::vector<std::string>& words2,
                              double substring_score) {
    SimilarityOptions options;
    options.substring_match_score = substring_score;
    options.levenshtein_multiplier = 0.0;
    options.levenshtein_threshold = 1.1;  // unreachable
    return word_similarity(words1, words2, options);
}

bool are_words_similar(const std::vector<std::string>& words1,
                       const std::vector<std::string>& words2,
                       double threshold,
                       const SimilarityOptions& options) {
    return word_similarity(words1, words2, options) >= threshold;
}

double text_similarity(const std::string& text1,
                       const std::string& text2,
                       const SimilarityOptions& options) {
    return word_similarity(tokenize_words(text1), tokenize_words(text2), options);
}

} // namespace nugget
