#include "text/edit_distance.hpp"
#include <algorithm>
#include <vector>

namespace nugget {

size_t levenshtein_distance(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // Keep the shorter string on the row axis
    const std::string& row_str = (a.size() < b.size()) ? a : b;
    const std::string& col_str = (a.size() < b.size()) ? b : a;

    std::vector<size_t> prev(row_str.size() + 1);
    std::vector<size_t> curr(row_str.size() + 1);

    for (size_t j = 0; j <= row_str.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= col_str.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= row_str.size(); ++j) {
            size_t cost = (col_str[i - 1] == row_str[j - 1]) ? 0 : 1;
            curr[j] = std::min({
                prev[j] + 1,         // deletion
                curr[j - 1] + 1,     // insertion
                prev[j - 1] + cost   // substitution
            });
        }
        std::swap(prev, curr);
    }

    return prev[row_str.size()];
}

double levenshtein_similarity(const std::string& a, const std::string& b) {
    size_t max_len = std::max({a.size(), b.size(), static_cast<size_t>(1)});
    size_t distance = levenshtein_distance(a, b);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(max_len);
}

bool is_levenshtein_similar(const std::string& a, const std::string& b,
                            double threshold) {
    return levenshtein_similarity(a, b) >= threshold;
}

size_t approximate_substring_distance(const std::string& pattern,
                                      const std::string& text) {
    if (pattern.empty()) return 0;
    if (text.empty()) return pattern.size();

    // Rows over text positions, columns over the pattern. Row 0 is all
    // zeros for the text axis, so a match may start anywhere.
    std::vector<size_t> prev(pattern.size() + 1);
    std::vector<size_t> curr(pattern.size() + 1);

    for (size_t i = 0; i <= pattern.size(); ++i) {
        prev[i] = i;
    }

    size_t best = prev[pattern.size()];

    for (size_t j = 1; j <= text.size(); ++j) {
        curr[0] = 0;
        for (size_t i = 1; i <= pattern.size(); ++i) {
            size_t cost = (pattern[i - 1] == text[j - 1]) ? 0 : 1;
            curr[i] = std::min({
                prev[i] + 1,
                curr[i - 1] + 1,
                prev[i - 1] + cost
            });
        }
        best = std::min(best, curr[pattern.size()]);
        if (best == 0) break;
        std::swap(prev, curr);
    }

    return best;
}

} // namespace nugget
