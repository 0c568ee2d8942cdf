#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace nugget {

// ============================================================================
// Whitespace and Case
// ============================================================================

/**
 * @brief Check for ASCII whitespace (space, tab, CR, LF, VT, FF)
 */
bool is_space(char c);

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
std::string trim(const std::string& text);

/**
 * @brief Lower-case ASCII letters, leave every other byte untouched
 *
 * Multi-byte UTF-8 sequences pass through unchanged, so byte lengths are
 * preserved and offsets computed on the result are valid in the input.
 */
std::string to_lower_ascii(const std::string& text);

/**
 * @brief Collapse runs of whitespace to a single space and trim the ends
 */
std::string collapse_whitespace(const std::string& text);

/**
 * @brief Normalize text for tolerant comparison
 *
 * Lower-cases ASCII, folds typographic variants to their plain forms
 * (curly apostrophes and backticks to ', curly and angle quotes to ",
 * en/em/minus dashes to -, the ellipsis character to ...), treats the
 * non-breaking space as whitespace, then collapses whitespace and trims.
 */
std::string advanced_normalize(const std::string& text);

// ============================================================================
// Word Tokenization
// ============================================================================

/**
 * @brief Byte range of one whitespace-delimited word
 */
struct WordSpan {
    size_t begin = 0;   ///< Offset of the first byte
    size_t end = 0;     ///< Offset one past the last byte
};

/**
 * @brief Locate every whitespace-delimited word in the text
 */
std::vector<WordSpan> word_spans(const std::string& text);

/**
 * @brief Split on whitespace, dropping empty tokens
 */
std::vector<std::string> tokenize_words(const std::string& text);

/**
 * @brief Join words with single spaces
 */
std::string join_words(const std::vector<std::string>& words,
                       size_t begin, size_t end);

// ============================================================================
// UTF-8 Helpers
// ============================================================================

/**
 * @brief Number of code points in a UTF-8 string
 *
 * Continuation bytes are not counted. Malformed input degrades to a byte
 * count rather than failing.
 */
size_t utf8_length(const std::string& text);

/**
 * @brief First n code points of the text
 */
std::string utf8_prefix(const std::string& text, size_t n);

/**
 * @brief Last n code points of the text
 */
std::string utf8_suffix(const std::string& text, size_t n);

} // namespace nugget
