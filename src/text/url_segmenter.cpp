#include "text/url_segmenter.hpp"
#include <regex>
#include <algorithm>

namespace nugget {

namespace {

// Host label: alphanumeric at both ends, hyphens inside, at most 63 chars
const char* const kStrictUrlBody =
    R"(https?://(?:www\.)?(?:[a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?\.)*)"
    R"([a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?(?:\.[a-z]{2,})?(?::\d{1,5})?(?:[/?#]\S*)?)";

const char* const kRelaxedUrlBody =
    R"((?:https?://)?(?:www\.)?[a-z0-9][a-z0-9-]*(?:\.[a-z0-9][a-z0-9-]*)*\.[a-z]{2,})"
    R"((?::\d{1,5})?(?:[/?#]\S*)?)";

const std::regex& strict_url_pattern() {
    static const std::regex pattern(
        std::string("^") + kStrictUrlBody + "$",
        std::regex::ECMAScript | std::regex::icase
    );
    return pattern;
}

const std::regex& relaxed_url_pattern() {
    static const std::regex pattern(
        std::string("^") + kRelaxedUrlBody + "$",
        std::regex::ECMAScript | std::regex::icase
    );
    return pattern;
}

const std::regex& strict_extraction_pattern() {
    static const std::regex pattern(
        kStrictUrlBody,
        std::regex::ECMAScript | std::regex::icase
    );
    return pattern;
}

const std::regex& relaxed_extraction_pattern() {
    static const std::regex pattern(
        kRelaxedUrlBody,
        std::regex::ECMAScript | std::regex::icase
    );
    return pattern;
}

struct Authority {
    size_t begin = 0;       ///< First byte after "://" (0 without a scheme)
    size_t end = 0;         ///< First '/', '?' or '#' after begin, or size()
    std::string host;       ///< Host as written, without userinfo or port
};

Authority locate_authority(const std::string& url) {
    Authority authority;

    size_t scheme_end = url.find("://");
    authority.begin = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;

    authority.end = url.find_first_of("/?#", authority.begin);
    if (authority.end == std::string::npos) {
        authority.end = url.size();
    }

    std::string hostport = url.substr(authority.begin, authority.end - authority.begin);

    size_t at = hostport.rfind('@');
    if (at != std::string::npos) {
        hostport = hostport.substr(at + 1);
    }

    size_t colon = hostport.find(':');
    authority.host = (colon == std::string::npos) ? hostport : hostport.substr(0, colon);

    return authority;
}

bool has_inner_space(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](char c) { return is_space(c); });
}

} // anonymous namespace

bool is_url(const std::string& text, bool strict) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;

    return std::regex_match(trimmed, strict ? strict_url_pattern() : relaxed_url_pattern());
}

std::optional<std::string> extract_url(const std::string& text, bool strict) {
    std::smatch match;
    const std::regex& pattern = strict ? strict_extraction_pattern() : relaxed_extraction_pattern();

    if (std::regex_search(text, match, pattern)) {
        return match.str(0);
    }
    return std::nullopt;
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    parsed.original_url = url;

    std::string text = trim(url);
    std::string lowered = to_lower_ascii(text);

    if (text.empty() || has_inner_space(text)) {
        parsed.domain = url;
        return parsed;
    }

    if (lowered.rfind("http", 0) != 0) {
        text = "https://" + text;
        lowered = "https://" + lowered;
    }

    size_t scheme_end = lowered.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        parsed.domain = url;
        return parsed;
    }

    Authority authority = locate_authority(text);
    if (authority.host.empty()) {
        parsed.domain = url;
        return parsed;
    }

    parsed.protocol = lowered.substr(0, scheme_end);
    parsed.domain = to_lower_ascii(authority.host);
    parsed.path = text.substr(authority.end);
    if (parsed.path == "/") {
        parsed.path.clear();
    }
    parsed.is_valid = true;

    return parsed;
}

AnchorPair split_url(const std::string& url) {
    std::string text = trim(url);
    Authority authority = locate_authority(text);

    AnchorPair anchors;
    anchors.start = text.substr(0, authority.end);

    std::string tail = text.substr(authority.end);
    if (tail.empty() || tail == "/") {
        anchors.end = authority.host;
    } else {
        anchors.end = tail;
    }

    return anchors;
}

AnchorPair split_words(const std::string& text,
                       size_t max_start_words,
                       size_t max_end_words) {
    AnchorPair anchors;

    auto spans = word_spans(text);
    if (spans.empty()) {
        return anchors;
    }

    size_t start_count = std::max<size_t>(1, std::min(max_start_words, spans.size()));
    size_t end_count = std::max<size_t>(1, std::min(max_end_words, spans.size()));

    const WordSpan& first = spans.front();
    const WordSpan& start_last = spans[start_count - 1];
    anchors.start = text.substr(first.begin, start_last.end - first.begin);

    const WordSpan& end_first = spans[spans.size() - end_count];
    const WordSpan& last = spans.back();
    anchors.end = text.substr(end_first.begin, last.end - end_first.begin);

    return anchors;
}

bool validate_boundaries(const std::string& start, const std::string& end) {
    return !start.empty() && !end.empty() && start != end;
}

} // namespace nugget
