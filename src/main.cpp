#include "cli/cli.hpp"
#include "pipeline/extraction_orchestrator.hpp"
#include "anchor/boundary_resolver.hpp"
#include "validation/content_validator.hpp"
#include "text/edit_distance.hpp"
#include "text/word_similarity.hpp"
#include "text/text_normalize.hpp"
#include "text/url_segmenter.hpp"
#include "llm/llm_provider.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>

using namespace nugget;

// ============== Helper Functions ==============

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write file: " + path);
    }
    file << content;
}

std::vector<std::string> nugget_type_names() {
    std::vector<std::string> names;
    for (auto type : all_nugget_types()) {
        names.push_back(nugget_type_to_string(type));
    }
    return names;
}

// --types values are checked against nugget_type_names() by the parser
std::vector<NuggetType> parse_types(const std::vector<std::string>& names) {
    std::vector<NuggetType> types;
    for (const auto& name : names) {
        if (auto type = parse_nugget_type(to_lower_ascii(name))) {
            types.push_back(*type);
        }
    }
    return types;
}

// ============== nugget extract ==============
int cmd_extract(const Args& args) {
    std::string input_path = args.require("input");
    std::string config_path = args.get("config").value;
    std::string output_path = args.get("output").value;
    bool verbose = args.has("verbose");

    OrchestratorConfig config = load_config_with_fallback(config_path);
    if (verbose) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: " << error << "\n";
        std::cerr << "  Set NUGGET_GEMINI_API_KEY or NUGGET_OPENAI_API_KEY, or provide --config.\n";
        return 1;
    }

    std::string content = read_text_file(input_path);

    std::string prompt;
    if (args.has("prompt-file")) {
        prompt = read_text_file(args.get("prompt-file").value);
    } else {
        prompt = args.get("prompt").value;
    }

    ExtractionOptions options;
    options.selected_types = parse_types(args.get("types").as_list());
    if (args.has("threshold")) {
        options.validation_threshold = args.get("threshold").as_ratio(0.0, 1.0, false);
    }
    if (args.has("temperature")) {
        options.temperature = args.get("temperature").as_ratio(0.0, 2.0, true);
    }
    options.timeout_ms = args.get("timeout").as_int(0);
    if (options.timeout_ms < 0) {
        throw UsageError("--timeout must not be negative");
    }

    ExtractionOrchestrator orchestrator(config);
    orchestrator.set_retry_callback([](const std::string& provider_id,
                                       int attempt,
                                       ErrorCategory category,
                                       double delay_ms,
                                       const std::string& next_provider_id) {
        std::cerr << "Attempt " << attempt << " on " << provider_id << " failed ("
                  << error_category_to_string(category) << ")";
        if (next_provider_id != provider_id) {
            std::cerr << ", switching to " << next_provider_id << "\n";
        } else {
            std::cerr << ", retrying in " << std::fixed << std::setprecision(0)
                      << delay_ms << " ms\n";
        }
    });

    EnsembleOptions ensemble;
    ensemble.runs = static_cast<int>(args.get("runs").as_count(1));
    if (args.has("similarity")) {
        ensemble.similarity_threshold = args.get("similarity").as_ratio(0.0, 1.0, false);
    }

    std::cerr << "Extracting golden nuggets from " << input_path
              << " (" << content.size() << " bytes) with " << config.llm_provider;
    if (ensemble.runs > 1) {
        std::cerr << " over " << ensemble.runs << " runs";
    }
    std::cerr << "...\n";

    ExtractionReport report;
    EnsembleReport ensemble_report;
    try {
        if (ensemble.runs > 1) {
            ensemble_report = orchestrator.extract_ensemble(content, prompt, options, ensemble);
        } else {
            report = orchestrator.extract_validated(content, prompt, options);
        }
    } catch (const ExtractionError& e) {
        std::cerr << "Error: " << e.user_message() << "\n";
        std::cerr << "  Category: " << error_category_to_string(e.category())
                  << ", attempts: " << e.attempts() << "\n";
        if (verbose) {
            std::cerr << "  Detail: " << e.what() << "\n";
        }
        return 2;
    }

    bool is_ensemble = ensemble.runs > 1;
    std::string output = (is_ensemble ? ensemble_report.to_json() : report.to_json()).dump(2);
    size_t nugget_count = is_ensemble ? ensemble_report.nuggets.size() : report.nuggets.size();
    if (output_path.empty()) {
        std::cout << output << "\n";
    } else {
        write_text_file(output_path, output);
        std::cerr << "Saved " << nugget_count << " nugget(s) to " << output_path << "\n";
    }

    if (args.has("summary")) {
        if (is_ensemble) {
            ensemble_report.print_summary();
        } else {
            report.print_summary();
        }
    }

    return 0;
}

// ============== nugget validate ==============
int cmd_validate(const Args& args) {
    std::string passage = args.require("passage");
    std::string source = read_text_file(args.require("source"));

    ValidationOptions validation;
    validation.min_confidence_threshold = args.get("threshold").as_ratio(0.0, 1.0, false);
    validation.fuzzy_tolerance = args.get("tolerance").as_ratio(0.0, 1.0, true);
    validation.verbose = args.has("verbose");

    BoundaryMatchOptions boundary;
    boundary.tolerance = validation.fuzzy_tolerance;
    boundary.min_confidence_threshold = validation.min_confidence_threshold;
    boundary.verbose = validation.verbose;

    BoundaryResolver resolver(boundary, validation);
    ValidationResult result = resolver.get_validator().validate(passage, source);
    AnchorPair anchors = resolver.resolve_anchors(passage, source);

    std::cout << "Score:     " << result.score << "\n";
    std::cout << "Tier:      " << match_method_to_string(result.tier) << "\n";
    std::cout << "Validated: " << (result.validated ? "yes" : "no") << "\n";
    std::cout << "Start:     \"" << anchors.start << "\"\n";
    std::cout << "End:       \"" << anchors.end << "\"\n";

    return result.validated ? 0 : 3;
}

// ============== nugget anchors ==============
int cmd_anchors(const Args& args) {
    std::string text = args.require("text");
    std::string source;
    if (args.has("source")) {
        source = read_text_file(args.get("source").value);
    }

    BoundaryMatchOptions options;
    options.max_start_words = args.get("start-words").as_count(options.max_start_words);
    options.max_end_words = args.get("end-words").as_count(options.max_end_words);

    BoundaryResolver resolver(options);
    AnchorPair anchors = resolver.resolve_anchors(text, source);

    nlohmann::json j;
    j["startContent"] = anchors.start;
    j["endContent"] = anchors.end;
    j["url"] = is_url(trim(text), true) || is_url(trim(text), false);
    std::cout << j.dump(2) << "\n";

    return 0;
}

// ============== nugget similarity ==============
int cmd_similarity(const Args& args) {
    std::string a = args.require("a");
    std::string b = args.require("b");

    std::vector<std::string> words_a = tokenize_words(advanced_normalize(a));
    std::vector<std::string> words_b = tokenize_words(advanced_normalize(b));

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Levenshtein distance:   " << levenshtein_distance(a, b) << "\n";
    std::cout << "Levenshtein similarity: " << levenshtein_similarity(a, b) << "\n";
    std::cout << "Word similarity:        " << word_similarity(words_a, words_b) << "\n";
    std::cout << "Simple word similarity: " << simple_word_similarity(words_a, words_b) << "\n";
    std::cout << "Text similarity:        " << text_similarity(a, b) << "\n";

    return 0;
}

// ============== nugget config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.require("output");

    OrchestratorConfig config = create_default_config();
    config.to_json_file(output_path);

    std::cout << "Wrote configuration template to " << output_path << "\n";
    std::cout << "Provider: " << config.llm_provider;
    if (!config.fallback_providers.empty()) {
        std::cout << " (fallback:";
        for (const auto& fallback : config.fallback_providers) {
            std::cout << " " << fallback.provider;
        }
        std::cout << ")";
    }
    std::cout << "\n";

    return 0;
}

int main(int argc, char** argv) {
    CLI cli("nugget", "1.0.0", "Golden nugget extraction and anchoring");

    // nugget extract
    cli.register_command({
        "extract",
        "Extract golden nuggets from a text file and anchor them",
        {
            {"input", "i", "Input text file", "", true, false},
            {"prompt", "p", "Extraction prompt (default prompt when omitted)", "", false, false},
            {"prompt-file", "f", "Read the extraction prompt from a file", "", false, false},
            {"config", "c", "Path to config file", "", false, false},
            {"output", "o", "JSON report path (stdout when omitted)", "", false, false},
            {"types", "t", "Comma-separated nugget types to keep", "", false, false,
             nugget_type_names(), true},
            {"threshold", "m", "Validation score needed to count as verified", "", false, false},
            {"temperature", "T", "Sampling temperature", "", false, false},
            {"timeout", "x", "Overall deadline in milliseconds, 0 for none", "0", false, false},
            {"runs", "r", "Extraction runs to combine by consensus", "1", false, false},
            {"similarity", "S", "Similarity needed to merge nuggets across runs", "", false, false},
            {"summary", "s", "Print a human-readable summary", "", false, true},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_extract,
        {
            "--input article.txt",
            "-i article.txt --types tool,model --output nuggets.json --summary",
            "-i article.txt --prompt-file prompt.txt --timeout 120000 --verbose",
            "-i article.txt --runs 3 --similarity 0.75 --summary"
        }
    });

    // nugget validate
    cli.register_command({
        "validate",
        "Check whether a passage occurs in a source file",
        {
            {"passage", "p", "Passage to look for", "", true, false},
            {"source", "s", "Source text file", "", true, false},
            {"threshold", "m", "Validation score needed to count as verified", "0.8", false, false},
            {"tolerance", "t", "Fuzzy match ratio", "0.8", false, false},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_validate,
        {
            "--passage \"the map is not the territory\" --source article.txt",
            "-p \"a bettr mental model\" -s article.txt --tolerance 0.7"
        }
    });

    // nugget anchors
    cli.register_command({
        "anchors",
        "Derive the start/end anchor pair for a passage",
        {
            {"text", "t", "Passage text", "", true, false},
            {"source", "s", "Source text file (for single-character passages)", "", false, false},
            {"start-words", "a", "Words in the start anchor", "5", false, false},
            {"end-words", "b", "Words in the end anchor", "5", false, false}
        },
        cmd_anchors,
        {
            "--text \"https://example.com/docs/guide\"",
            "-t \"Read once for design, then once for details.\" -a 3 -b 3"
        }
    });

    // nugget similarity
    cli.register_command({
        "similarity",
        "Compare two strings with every similarity measure",
        {
            {"a", "a", "First string", "", true, false},
            {"b", "b", "Second string", "", true, false}
        },
        cmd_similarity,
        {
            "-a \"mental model\" -b \"mental modle\""
        }
    });

    // nugget config
    cli.register_command({
        "config",
        "Write a configuration template (API keys redacted)",
        {
            {"output", "o", "Output path", ".nugget_config.example.json", false, false}
        },
        cmd_config,
        {}
    });

    return cli.run(argc, argv);
}
