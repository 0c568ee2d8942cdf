#pragma once

#include "text/text_normalize.hpp"
#include <string>
#include <optional>

namespace nugget {

/**
 * @brief Start and end strings used to locate a passage by literal search
 */
struct AnchorPair {
    std::string start;
    std::string end;

    bool operator==(const AnchorPair& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const AnchorPair& other) const { return !(*this == other); }
};

/**
 * @brief URL split into the parts used for anchoring
 */
struct ParsedUrl {
    std::string protocol;       ///< Lower-case scheme without "://"
    std::string domain;         ///< Lower-case host name, no port
    std::string path;           ///< Path, query and fragment; "" for the root
    bool is_valid = false;
    std::string original_url;
};

/**
 * @brief Check whether the whole (trimmed) text is a URL
 *
 * Strict mode requires an http(s) scheme and accepts domain names,
 * localhost and IPv4 hosts with an optional port. Relaxed mode makes the
 * scheme optional but requires a dotted name ending in an alphabetic TLD.
 */
bool is_url(const std::string& text, bool strict = true);

/**
 * @brief First URL embedded in the text, if any
 */
std::optional<std::string> extract_url(const std::string& text, bool strict = true);

/**
 * @brief Break a URL into protocol, domain and path
 *
 * Inputs without an http(s) scheme are parsed as https. Never throws;
 * unparseable input comes back with is_valid = false and the whole input in
 * domain.
 */
ParsedUrl parse_url(const std::string& url);

/**
 * @brief Split a URL at the authority/path boundary
 *
 * start is the scheme and authority exactly as written
 * ("https://example.com:8080"); end is the path, query and fragment
 * ("/a/b?q=1"). With no path, end is the bare host so the two differ.
 */
AnchorPair split_url(const std::string& url);

/**
 * @brief Take the first and last words of prose as anchors
 *
 * Both anchors are literal slices of the input, from the first word of the
 * span to its last word, so inner whitespace is preserved.
 */
AnchorPair split_words(const std::string& text,
                       size_t max_start_words,
                       size_t max_end_words);

/**
 * @brief Anchors are usable when both are non-empty and they differ
 */
bool validate_boundaries(const std::string& start, const std::string& end);

} // namespace nugget
