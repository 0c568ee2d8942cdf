#include "text/text_normalize.hpp"
#include <cctype>

namespace nugget {

namespace {

struct Replacement {
    const char* pattern;
    const char* replacement;
};

// Multi-byte UTF-8 sequences folded by advanced_normalize
const Replacement kVariantFolds[] = {
    {"\xE2\x80\x98", "'"},     // left single quotation mark
    {"\xE2\x80\x99", "'"},     // right single quotation mark
    {"\xCA\xBC", "'"},         // modifier letter apostrophe
    {"\xC2\xB4", "'"},         // acute accent
    {"\xE2\x80\x9C", "\""},    // left double quotation mark
    {"\xE2\x80\x9D", "\""},    // right double quotation mark
    {"\xE2\x80\x9E", "\""},    // double low-9 quotation mark
    {"\xC2\xAB", "\""},        // left guillemet
    {"\xC2\xBB", "\""},        // right guillemet
    {"\xE2\x80\x93", "-"},     // en dash
    {"\xE2\x80\x94", "-"},     // em dash
    {"\xE2\x88\x92", "-"},     // minus sign
    {"\xE2\x80\xA6", "..."},   // horizontal ellipsis
    {"\xC2\xA0", " "},         // no-break space
};

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

// ============================================================================
// Whitespace and Case
// ============================================================================

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string trim(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && is_space(text[first])) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && is_space(text[last - 1])) {
        --last;
    }
    return text.substr(first, last - first);
}

std::string to_lower_ascii(const std::string& text) {
    std::string result = text;
    for (auto& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 128) {
            c = static_cast<char>(std::tolower(uc));
        }
    }
    return result;
}

std::string collapse_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

std::string advanced_normalize(const std::string& text) {
    std::string folded;
    folded.reserve(text.size());

    for (size_t i = 0; i < text.size(); ) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == '`') {
            folded += '\'';
            ++i;
            continue;
        }

        if (c >= 0x80) {
            bool replaced = false;
            for (const auto& fold : kVariantFolds) {
                std::string pattern(fold.pattern);
                if (text.compare(i, pattern.size(), pattern) == 0) {
                    folded += fold.replacement;
                    i += pattern.size();
                    replaced = true;
                    break;
                }
            }
            if (replaced) continue;
        }

        folded += static_cast<char>(c);
        ++i;
    }

    return collapse_whitespace(to_lower_ascii(folded));
}

// ============================================================================
// Word Tokenization
// ============================================================================

std::vector<WordSpan> word_spans(const std::string& text) {
    std::vector<WordSpan> spans;

    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        if (i >= text.size()) break;

        WordSpan span;
        span.begin = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        span.end = i;
        spans.push_back(span);
    }

    return spans;
}

std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& span : word_spans(text)) {
        words.push_back(text.substr(span.begin, span.end - span.begin));
    }
    return words;
}

std::string join_words(const std::vector<std::string>& words,
                       size_t begin, size_t end) {
    std::string result;
    for (size_t i = begin; i < end && i < words.size(); ++i) {
        if (!result.empty()) result += ' ';
        result += words[i];
    }
    return result;
}

// ============================================================================
// UTF-8 Helpers
// ============================================================================

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (!is_continuation_byte(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string utf8_prefix(const std::string& text, size_t n) {
    if (n == 0) return "";

    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation_byte(static_cast<unsigned char>(text[i]))) {
            if (seen == n) {
                return text.substr(0, i);
            }
            ++seen;
        }
    }
    return text;
}

std::string utf8_suffix(const std::string& text, size_t n) {
    if (n == 0) return "";

    size_t seen = 0;
    for (size_t i = text.size(); i > 0; --i) {
        if (!is_continuation_byte(static_cast<unsigned char>(text[i - 1]))) {
            ++seen;
            if (seen == n) {
                return text.substr(i - 1);
            }
        }
    }
    return text;
}

} // namespace nugget
