#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nugget {

// ============================================================================
// Nugget Types
// ============================================================================

enum class NuggetType {
    Tool,           // Concrete tool, technique or method
    Media,          // Book, article, video or other resource
    Explanation,    // "Aha" explanation of a concept
    Analogy,        // Comparison or metaphor
    Model           // Mental model or framework
};

inline std::string nugget_type_to_string(NuggetType type) {
    switch (type) {
        case NuggetType::Tool: return "tool";
        case NuggetType::Media: return "media";
        case NuggetType::Explanation: return "explanation";
        case NuggetType::Analogy: return "analogy";
        case NuggetType::Model: return "model";
        default: return "explanation";
    }
}

inline const std::vector<NuggetType>& all_nugget_types() {
    static const std::vector<NuggetType> types = {
        NuggetType::Tool,
        NuggetType::Media,
        NuggetType::Explanation,
        NuggetType::Analogy,
        NuggetType::Model
    };
    return types;
}

/**
 * @brief Strict parse of a canonical type name
 */
inline std::optional<NuggetType> parse_nugget_type(const std::string& s) {
    if (s == "tool") return NuggetType::Tool;
    if (s == "media") return NuggetType::Media;
    if (s == "explanation") return NuggetType::Explanation;
    if (s == "analogy") return NuggetType::Analogy;
    if (s == "model") return NuggetType::Model;
    return std::nullopt;
}

/**
 * @brief Lenient parse of the spellings providers actually return
 *
 * Case-insensitive; unknown labels map to Explanation.
 */
inline NuggetType normalize_nugget_type(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t first = lower.find_first_not_of(" \t\n\r");
    size_t last = lower.find_last_not_of(" \t\n\r");
    lower = (first == std::string::npos) ? "" : lower.substr(first, last - first + 1);

    if (auto canonical = parse_nugget_type(lower)) return *canonical;

    if (lower == "mental model" || lower == "mental_model" ||
        lower == "mental-model" || lower == "framework") return NuggetType::Model;
    if (lower == "technique" || lower == "method") return NuggetType::Tool;
    if (lower == "resource" || lower == "book" || lower == "article") return NuggetType::Media;
    if (lower == "concept" || lower == "aha! moments" || lower == "aha moment") return NuggetType::Explanation;
    if (lower == "comparison" || lower == "metaphor") return NuggetType::Analogy;

    return NuggetType::Explanation;
}

// ============================================================================
// Match Methods
// ============================================================================

enum class MatchMethod {
    Exact,
    CaseInsensitive,
    Fuzzy,
    PartialPrefix,
    Unverified
};

inline std::string match_method_to_string(MatchMethod method) {
    switch (method) {
        case MatchMethod::Exact: return "exact";
        case MatchMethod::CaseInsensitive: return "case_insensitive";
        case MatchMethod::Fuzzy: return "fuzzy";
        case MatchMethod::PartialPrefix: return "partial_prefix";
        case MatchMethod::Unverified: return "unverified";
        default: return "unverified";
    }
}

inline MatchMethod string_to_match_method(const std::string& s) {
    if (s == "exact") return MatchMethod::Exact;
    if (s == "case_insensitive") return MatchMethod::CaseInsensitive;
    if (s == "fuzzy") return MatchMethod::Fuzzy;
    if (s == "partial_prefix") return MatchMethod::PartialPrefix;
    return MatchMethod::Unverified;
}

// ============================================================================
// Candidates and Resolved Nuggets
// ============================================================================

/**
 * @brief Passage proposed by a provider, not yet checked against the source
 */
struct RawCandidate {
    NuggetType type = NuggetType::Explanation;
    std::string full_content;
    double confidence = 0.0;    ///< Provider confidence in [0, 1]

    bool operator==(const RawCandidate& other) const {
        return type == other.type && full_content == other.full_content &&
               confidence == other.confidence;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["type"] = nugget_type_to_string(type);
        j["fullContent"] = full_content;
        j["confidence"] = confidence;
        return j;
    }
};

/**
 * @brief Candidate after validation and anchor derivation
 *
 * start_anchor and end_anchor differ and are non-empty whenever
 * full_content is non-empty. Instances are never edited after creation.
 */
struct ResolvedNugget {
    NuggetType type = NuggetType::Explanation;
    std::string full_content;
    std::string start_anchor;
    std::string end_anchor;
    double confidence = 0.0;
    double validation_score = 0.0;
    MatchMethod match_method = MatchMethod::Unverified;

    bool is_validated() const { return match_method != MatchMethod::Unverified; }

    bool operator==(const ResolvedNugget& other) const {
        return type == other.type &&
               full_content == other.full_content &&
               start_anchor == other.start_anchor &&
               end_anchor == other.end_anchor &&
               confidence == other.confidence &&
               validation_score == other.validation_score &&
               match_method == other.match_method;
    }
    bool operator!=(const ResolvedNugget& other) const { return !(*this == other); }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["type"] = nugget_type_to_string(type);
        j["fullContent"] = full_content;
        j["startContent"] = start_anchor;
        j["endContent"] = end_anchor;
        j["confidence"] = confidence;
        j["validationScore"] = validation_score;
        j["matchMethod"] = match_method_to_string(match_method);
        return j;
    }

    static ResolvedNugget from_json(const nlohmann::json& j) {
        if (!j.contains("fullContent") || !j["fullContent"].is_string()) {
            throw std::runtime_error("Nugget JSON is missing fullContent");
        }

        ResolvedNugget nugget;
        nugget.type = normalize_nugget_type(j.value("type", "explanation"));
        nugget.full_content = j["fullContent"].get<std::string>();
        nugget.start_anchor = j.value("startContent", "");
        nugget.end_anchor = j.value("endContent", "");
        nugget.confidence = j.value("confidence", 0.0);
        nugget.validation_score = j.value("validationScore", 0.0);
        nugget.match_method = string_to_match_method(j.value("matchMethod", "unverified"));
        return nugget;
    }
};

} // namespace nugget
