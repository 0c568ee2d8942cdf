#include "pipeline/extraction_orchestrator.hpp"
#include "anchor/boundary_resolver.hpp"
#include "llm/llm_provider.hpp"
#include <iostream>
#include <iomanip>

using namespace nugget;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_nugget(size_t index, const ResolvedNugget& n) {
    std::cout << "  Nugget " << index << " (" << nugget_type_to_string(n.type) << "):\n";
    std::cout << "    Content: " << n.full_content << "\n";
    std::cout << "    Start:   \"" << n.start_anchor << "\"\n";
    std::cout << "    End:     \"" << n.end_anchor << "\"\n";
    std::cout << "    Match:   " << match_method_to_string(n.match_method)
              << " (score " << std::fixed << std::setprecision(2) << n.validation_score << ")\n";
}

const char* kSampleText = R"(
Most teams treat code review as a gate. A better mental model is a conversation:
the reviewer is a second author who happens to arrive late.
If you want a practical tool, try the "two-pass review": read once for design,
then once for details, and never mix the two.
Richard Hamming's talk "You and Your Research" is still the best hour you can spend
on choosing problems. See https://www.cs.virginia.edu/~robins/YouAndYourResearch.html
)";

int main(int argc, char* argv[]) {
    print_separator("Golden Nugget Extraction Example");

    std::string text = argc > 1 ? argv[1] : kSampleText;

    // =========================================================================
    // Example 1: Anchoring candidates without an LLM
    // =========================================================================

    print_separator("Example 1: Validating and Anchoring Candidates");

    std::vector<RawCandidate> candidates = {
        {NuggetType::Model, "A better mental model is a conversation: the reviewer is a second author who happens to arrive late.", 0.9},
        {NuggetType::Tool, "try the two-pass review: read once for design, then once for details", 0.8},
        {NuggetType::Media, "https://www.cs.virginia.edu/~robins/YouAndYourResearch.html", 0.95},
        {NuggetType::Explanation, "Code review works best when it is fast.", 0.5}
    };

    BoundaryResolver resolver;
    auto nuggets = resolver.resolve_all(candidates, text);
    for (size_t i = 0; i < nuggets.size(); ++i) {
        print_nugget(i + 1, nuggets[i]);
    }

    // =========================================================================
    // Example 2: Full extraction with retry and fallback
    // =========================================================================

    print_separator("Example 2: Extracting with an LLM");

    OrchestratorConfig config = load_config_with_fallback();
    std::string error;
    if (!config.validate(error)) {
        std::cout << "No usable configuration (" << error << ").\n\n";
        std::cout << "Create .nugget_config.json in the project root:\n";
        std::cout << "   {\n";
        std::cout << "     \"provider\": \"gemini\",\n";
        std::cout << "     \"api_key\": \"your-key-here\",\n";
        std::cout << "     \"fallback_providers\": [{\"provider\": \"openai\", \"api_key\": \"...\"}]\n";
        std::cout << "   }\n\n";
        std::cout << "Or set environment variables:\n";
        std::cout << "   export NUGGET_GEMINI_API_KEY='your-key'\n";
        std::cout << "   export NUGGET_FALLBACK_PROVIDER='openai'\n\n";
        return 0;
    }

    config.verbose = true;
    ExtractionOrchestrator orchestrator(config);

    try {
        ExtractionReport report = orchestrator.extract_validated(text);
        report.print_summary();
    } catch (const ExtractionError& e) {
        std::cerr << "Extraction failed: " << e.user_message() << "\n";
        return 1;
    }

    return 0;
}
