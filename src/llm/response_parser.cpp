#include "llm/response_parser.hpp"
#include "llm/provider_error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <vector>

using json = nlohmann::json;

namespace nugget {

namespace {

std::string trim_json_whitespace(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::string close_open_brackets(const std::string& text) {
    std::string repaired = text;
    std::vector<char> closers;
    bool in_string = false;
    bool escaped = false;

    for (char c : repaired) {
        if (escaped) { escaped = false; continue; }
        if (c == '\\') { escaped = true; continue; }
        if (c == '"') { in_string = !in_string; continue; }
        if (in_string) continue;

        if (c == '{') closers.push_back('}');
        else if (c == '[') closers.push_back(']');
        else if ((c == '}' || c == ']') && !closers.empty() && closers.back() == c) {
            closers.pop_back();
        }
    }

    // A response cut off mid-string needs the quote closed first
    if (in_string) {
        repaired += '"';
    }

    // Drop a dangling separator left before the cut
    size_t last = repaired.find_last_not_of(" \t\n\r");
    if (last != std::string::npos && (repaired[last] == ',' || repaired[last] == ':')) {
        repaired.erase(last);
    }

    while (!closers.empty()) {
        repaired += closers.back();
        closers.pop_back();
    }

    return repaired;
}

} // anonymous namespace

std::string clean_json_response(const std::string& text) {
    std::string clean_json = trim_json_whitespace(text);

    // Remove ```json or ``` markers
    if (clean_json.compare(0, 7, "```json") == 0) {
        clean_json = clean_json.substr(7);
    } else if (clean_json.compare(0, 3, "```") == 0) {
        clean_json = clean_json.substr(3);
    }

    size_t last_backticks = clean_json.rfind("```");
    if (last_backticks != std::string::npos && last_backticks > 0) {
        clean_json = clean_json.substr(0, last_backticks);
    }

    clean_json = trim_json_whitespace(clean_json);

    // Replace unescaped newlines inside strings
    std::string fixed_json;
    fixed_json.reserve(clean_json.size());
    bool in_string = false;
    bool escaped = false;

    for (char c : clean_json) {
        if (escaped) {
            fixed_json += c;
            escaped = false;
            continue;
        }

        if (c == '\\') {
            fixed_json += c;
            escaped = true;
            continue;
        }

        if (c == '"') {
            in_string = !in_string;
            fixed_json += c;
            continue;
        }

        if (in_string && (c == '\n' || c == '\r')) {
            if (c == '\n') {
                fixed_json += ' ';
            }
            continue;
        }

        fixed_json += c;
    }

    return fixed_json;
}

std::vector<RawCandidate> parse_candidates_json(const std::string& json_str,
                                                const std::string& provider_id) {
    std::string cleaned = clean_json_response(json_str);
    if (cleaned.empty()) {
        throw ProviderError(ErrorCategory::Structural,
                            "Malformed response: empty payload", 0, provider_id);
    }

    json j;
    try {
        j = json::parse(cleaned);
    } catch (const json::parse_error&) {
        try {
            j = json::parse(close_open_brackets(cleaned));
        } catch (const json::parse_error& e) {
            throw ProviderError(ErrorCategory::Structural,
                                std::string("Malformed response JSON: ") + e.what(),
                                0, provider_id);
        }
    }

    if (!j.is_object() || !j.contains("golden_nuggets") || !j["golden_nuggets"].is_array()) {
        throw ProviderError(ErrorCategory::Structural,
                            "Invalid response format: missing golden_nuggets array",
                            0, provider_id);
    }

    std::vector<RawCandidate> candidates;

    for (const auto& entry : j["golden_nuggets"]) {
        if (!entry.is_object() || !entry.contains("fullContent") ||
            !entry["fullContent"].is_string()) {
            throw ProviderError(ErrorCategory::Structural,
                                "Invalid response format: nugget missing required field fullContent",
                                0, provider_id);
        }

        RawCandidate candidate;
        candidate.full_content = entry["fullContent"].get<std::string>();

        if (entry.contains("type") && entry["type"].is_string()) {
            candidate.type = normalize_nugget_type(entry["type"].get<std::string>());
        }

        candidate.confidence = 1.0;
        if (entry.contains("confidence") && entry["confidence"].is_number()) {
            candidate.confidence = std::min(1.0, std::max(0.0, entry["confidence"].get<double>()));
        }

        candidates.push_back(candidate);
    }

    return candidates;
}

std::vector<RawCandidate> filter_candidates_by_type(const std::vector<RawCandidate>& candidates,
                                                    const std::vector<NuggetType>& types) {
    if (types.empty()) {
        return candidates;
    }

    std::vector<RawCandidate> filtered;
    for (const auto& candidate : candidates) {
        if (std::find(types.begin(), types.end(), candidate.type) != types.end()) {
            filtered.push_back(candidate);
        }
    }
    return filtered;
}

std::string candidates_to_json(const std::vector<RawCandidate>& candidates) {
    json nuggets = json::array();
    for (const auto& candidate : candidates) {
        nuggets.push_back(candidate.to_json());
    }

    json j;
    j["golden_nuggets"] = nuggets;
    return j.dump(2);
}

} // namespace nugget
