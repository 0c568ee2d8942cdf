#pragma once

#include "nugget/nugget.hpp"
#include <string>
#include <vector>

namespace nugget {

/**
 * @brief Strip markdown fences and repair common LLM JSON defects
 *
 * Removes ```json fences and replaces raw newlines inside string literals.
 * Returns text that may still fail to parse.
 */
std::string clean_json_response(const std::string& text);

/**
 * @brief Parse a {"golden_nuggets": [...]} payload into candidates
 *
 * A payload that fails to parse is retried once with the brackets left open
 * by a truncated response closed. Each entry needs a string "fullContent";
 * "type" is normalized leniently and "confidence" is clamped to [0, 1]
 * (1.0 when absent).
 *
 * @throws ProviderError with category Structural when the payload is not
 *         JSON or does not have the expected shape
 */
std::vector<RawCandidate> parse_candidates_json(const std::string& json_str,
                                                const std::string& provider_id = "");

/**
 * @brief Keep only candidates of the selected types; empty selection keeps all
 */
std::vector<RawCandidate> filter_candidates_by_type(const std::vector<RawCandidate>& candidates,
                                                    const std::vector<NuggetType>& types);

/**
 * @brief Serialize candidates back to the payload shape
 */
std::string candidates_to_json(const std::vector<RawCandidate>& candidates);

} // namespace nugget
